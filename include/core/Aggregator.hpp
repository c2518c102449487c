#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/SubstitutionClassifier.hpp"

namespace TrinucMatrix {

/**
 * @brief Per-sample mutation and background counts.
 *
 * Lookups of substitutions or motifs that were never observed return 0.
 * Derived quantities (n_C, tCw, ...) are computed from the raw counts on
 * access.
 */
struct SampleAggregate {
    std::string sample_id;

    // Background composition summed over every +/-20 bp window of the sample
    int64_t bg_a = 0;
    int64_t bg_c = 0;
    int64_t bg_g = 0;
    int64_t bg_t = 0;
    int64_t bg_tcw = 0;  ///< TCA + TCT
    int64_t bg_wga = 0;  ///< TGA + AGA

    std::map<std::string, int64_t> substitution_counts;  ///< "C>T" -> n (raw orientation)
    std::map<std::string, int64_t> motif_counts;         ///< "T[G>A]A" -> n (raw orientation)
    std::array<int64_t, kNumMotifClasses> type_motif_counts{};  ///< Canonical column order

    int64_t bg_bases() const { return bg_a + bg_c + bg_g + bg_t; }

    int64_t substitution(const std::string& label) const;
    int64_t motif(const std::string& label) const;

    int64_t n_a() const;
    int64_t n_c() const;
    int64_t n_g() const;
    int64_t n_t() const;
    int64_t n_mutations() const { return n_a() + n_c() + n_g() + n_t(); }

    /// (C>G + G>C) + C>T + G>A
    int64_t apobec_mutations() const;

    int64_t tcw_to_a() const { return motif("T[C>A]A") + motif("T[C>A]T"); }
    int64_t tcw_to_g() const { return motif("T[C>G]A") + motif("T[C>G]T"); }
    int64_t tcw_to_t() const { return motif("T[C>T]A") + motif("T[C>T]T"); }
    int64_t tcw() const { return tcw_to_a() + tcw_to_g() + tcw_to_t(); }

    int64_t wga_to_c() const { return motif("A[G>C]A") + motif("T[G>C]A"); }
    int64_t wga_to_t() const { return motif("A[G>T]A") + motif("T[G>T]A"); }
    int64_t wga_to_a() const { return motif("A[G>A]A") + motif("T[G>A]A"); }
    int64_t wga() const { return wga_to_c() + wga_to_t() + wga_to_a(); }

    /**
     * @brief Numerator of the enrichment ratio ("tCw_to_G+tCw_to_T").
     *
     * T[C>G]T + T[C>G]A + T[C>T]T + T[C>T]A + T[G>C]A + A[G>C]A + T[G>A]A + A[G>A]A.
     * This union of tCw and wGa motifs is inherited as is.
     */
    int64_t tcw_wga_mutations() const;

    int64_t non_apobec_mutations() const { return n_mutations() - tcw_wga_mutations(); }

    /// Sum of the 96-class row; equals n_mutations() for classified SNVs.
    int64_t classified_mutations() const;
};

/**
 * @brief Accumulates classified variants into per-sample aggregates.
 */
class Aggregator {
public:
    void add(const ClassifiedVariant& variant);

    void add_all(const std::vector<ClassifiedVariant>& variants) {
        for (const auto& v : variants) {
            add(v);
        }
    }

    /**
     * @brief Aggregates keyed by sample id (ascending).
     */
    const std::map<std::string, SampleAggregate>& samples() const { return samples_; }

    size_t num_samples() const { return samples_.size(); }

private:
    std::map<std::string, SampleAggregate> samples_;
};

}  // namespace TrinucMatrix
