#pragma once

#include <htslib/faidx.h>

#include <set>
#include <string>

#include "core/SequenceProvider.hpp"

namespace TrinucMatrix {

/**
 * @brief RAII wrapper for indexed FASTA access with HTSlib.
 *
 * Implements SequenceProvider on top of faidx. Sequences are fetched on
 * demand, so only the requested range is ever held in memory.
 *
 * Thread-safety: a faidx handle must not be shared between threads. The
 * pipeline performs all fetches from a single thread.
 *
 * Usage:
 *   FastaReader fasta("hg19.fa");
 *   std::string tri = fasta.get_sequence("chr17", 7577119, 7577121);
 */
class FastaReader : public SequenceProvider {
public:
    /**
     * @brief Opens the FASTA and its index.
     * @param fasta_path Path to the FASTA file (must have a .fai index).
     * @throws std::runtime_error if the file or index cannot be loaded.
     */
    explicit FastaReader(const std::string& fasta_path);

    ~FastaReader() override;

    // Disable copy, allow move
    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept;
    FastaReader& operator=(FastaReader&&) noexcept;

    /**
     * @brief Fetches contig[start..end], 1-based inclusive, uppercased.
     *
     * @note Returns empty string if the contig is missing or start > end.
     */
    std::string get_sequence(const std::string& contig, int64_t start, int64_t end) const override;

    /**
     * @brief All sequence names present in the .fai index.
     */
    std::set<std::string> list_contigs() const override;

    /**
     * @brief Length of a contig in bp, or -1 if not found.
     */
    int64_t contig_length(const std::string& contig) const override;

    bool is_loaded() const { return fai_ != nullptr; }

    const std::string& get_path() const { return fasta_path_; }

private:
    std::string fasta_path_;
    faidx_t* fai_;
};

} // namespace TrinucMatrix
