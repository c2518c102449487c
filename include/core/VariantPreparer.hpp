#pragma once

#include <set>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/Types.hpp"

namespace TrinucMatrix {

/**
 * @brief Filtering and contig-renaming options for variant preparation.
 */
struct PrepareOptions {
    bool include_synonymous = true;        ///< Merge the silent pool back in
    std::set<std::string> ignore_contigs;  ///< Contigs to drop (exact match, before renaming)
    std::string contig_prefix;             ///< Empty = no renaming
    PrefixMode prefix_mode = PrefixMode::ADD;
};

/**
 * @brief True if the classification belongs to the fixed silent set
 *        (3'UTR, 5'UTR, 3'Flank, Targeted_Region, Silent, Intron, RNA, IGR,
 *        Splice_Region, 5'Flank, lincRNA).
 */
bool is_silent_classification(const std::string& classification);

/**
 * @brief Applies the contig prefix rule to a single contig name.
 *
 * ADD prepends the prefix; REMOVE deletes every literal occurrence of it.
 */
std::string apply_contig_prefix(const std::string& contig, const std::string& prefix, PrefixMode mode);

/**
 * @brief Produces the SNV-only list that enters context extraction.
 *
 * Steps, in order:
 * 1. drop silent classifications from the main table;
 * 2. append the silent pool when include_synonymous is set;
 * 3. drop ignore_contigs;
 * 4. rename contigs with the prefix rule;
 * 5. keep Variant_Type == "SNP" with single A/C/G/T alleles, REF != ALT.
 *
 * Drop counts are written to diagnostics.
 *
 * @throws FatalInputError if no SNV remains.
 */
std::vector<Variant> prepare_variants(const std::vector<Variant>& variants, const std::vector<Variant>& silent_pool,
                                      const PrepareOptions& options, PipelineDiagnostics& diagnostics);

}  // namespace TrinucMatrix
