#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/SequenceProvider.hpp"

namespace TrinucMatrix {

/**
 * @brief A prepared SNV together with its reference context.
 */
struct VariantContext {
    Variant variant;
    SequenceContext context;
};

/**
 * @brief Extracts the trinucleotide and the background window of each SNV.
 *
 * Variants are grouped by contig. For every contig one span covering all of
 * its windows is fetched from the SequenceProvider, and windows are sliced
 * from that span. Background composition is counted in parallel (OpenMP).
 *
 * Dropped variants are reported through PipelineDiagnostics:
 * - contigs the provider does not know (missing_contigs, missing_contig_variants);
 * - contexts whose middle base differs from Reference_Allele, that run off
 *   the contig, or whose flanks are not A/C/G/T (context_mismatches).
 */
class ContextExtractor {
public:
    /**
     * @param provider Reference sequence source, must outlive the extractor.
     * @param background_flank Bases on each side of the variant in the background window.
     * @param num_threads OpenMP threads for background counting.
     */
    explicit ContextExtractor(const SequenceProvider& provider, int64_t background_flank = 20, int num_threads = 1);

    /**
     * @brief Extracts contexts for all SNVs, preserving input order.
     *
     * @throws FatalInputError if every variant sits on an unknown contig.
     * @throws std::runtime_error if the provider fails to return a contig span.
     */
    std::vector<VariantContext> extract(const std::vector<Variant>& snvs, PipelineDiagnostics& diagnostics) const;

    /**
     * @brief Fills nucleotide and TCA/TCT/AGA/TGA counts from context.background.
     *
     * Motifs are counted at every offset (step 1, overlapping). Lowercase
     * bases are counted as uppercase.
     */
    static void count_background(SequenceContext& context);

private:
    const SequenceProvider& provider_;
    int64_t background_flank_;
    int num_threads_;
};

}  // namespace TrinucMatrix
