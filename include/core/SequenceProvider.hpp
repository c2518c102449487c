#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace TrinucMatrix {

/**
 * @brief Random-access source of reference sequence.
 *
 * Coordinates are 1-based and inclusive on both ends. Implementations return
 * uppercase sequence; ambiguous bases (N, IUPAC codes) are passed through.
 * Requests are deterministic and idempotent.
 *
 * The provider is an explicit object owned by the caller: construct it once,
 * hand it to the pipeline by reference, release it when done.
 */
class SequenceProvider {
public:
    virtual ~SequenceProvider() = default;

    /**
     * @brief Fetches contig[start..end] (1-based, inclusive).
     *
     * @return Uppercase sequence. Empty if the contig is unknown or the range
     *         does not overlap it. Ranges running past the contig end are
     *         truncated at the last base.
     */
    virtual std::string get_sequence(const std::string& contig, int64_t start, int64_t end) const = 0;

    /**
     * @brief Names of all contigs the provider can serve.
     */
    virtual std::set<std::string> list_contigs() const = 0;

    /**
     * @brief Contig length in bp, or -1 if the contig is unknown.
     */
    virtual int64_t contig_length(const std::string& contig) const = 0;

    bool has_contig(const std::string& contig) const {
        return contig_length(contig) >= 0;
    }
};

/**
 * @brief SequenceProvider over sequences held in memory.
 *
 * Useful for small references and for tests. Sequences are uppercased on
 * insertion.
 */
class InMemorySequenceProvider : public SequenceProvider {
public:
    InMemorySequenceProvider() = default;

    /**
     * @brief Adds (or replaces) a contig.
     */
    void add_contig(const std::string& name, const std::string& sequence);

    std::string get_sequence(const std::string& contig, int64_t start, int64_t end) const override;
    std::set<std::string> list_contigs() const override;
    int64_t contig_length(const std::string& contig) const override;

private:
    std::map<std::string, std::string> contigs_;
};

}  // namespace TrinucMatrix
