#include "core/VariantPreparer.hpp"

#include "utils/Logger.hpp"

namespace TrinucMatrix {

namespace {

bool is_valid_snv_allele(const std::string& allele) {
    return allele.size() == 1 && is_nucleotide(allele[0]);
}

}  // namespace

bool is_silent_classification(const std::string& classification) {
    static const std::set<std::string> silent = {"3'UTR",  "5'UTR", "3'Flank", "Targeted_Region",
                                                 "Silent", "Intron", "RNA",    "IGR",
                                                 "Splice_Region", "5'Flank", "lincRNA"};
    return silent.count(classification) > 0;
}

std::string apply_contig_prefix(const std::string& contig, const std::string& prefix, PrefixMode mode) {
    if (prefix.empty()) {
        return contig;
    }
    if (mode == PrefixMode::ADD) {
        return prefix + contig;
    }

    std::string result;
    result.reserve(contig.size());
    size_t pos = 0;
    while (true) {
        size_t hit = contig.find(prefix, pos);
        if (hit == std::string::npos) {
            result.append(contig, pos, std::string::npos);
            break;
        }
        result.append(contig, pos, hit - pos);
        pos = hit + prefix.size();
    }
    return result;
}

std::vector<Variant> prepare_variants(const std::vector<Variant>& variants, const std::vector<Variant>& silent_pool,
                                      const PrepareOptions& options, PipelineDiagnostics& diagnostics) {
    diagnostics.input_variants = variants.size();
    diagnostics.silent_pool_variants = silent_pool.size();

    std::vector<Variant> merged;
    merged.reserve(variants.size() + (options.include_synonymous ? silent_pool.size() : 0));

    for (const auto& v : variants) {
        if (is_silent_classification(v.variant_classification)) {
            diagnostics.silent_removed++;
            continue;
        }
        merged.push_back(v);
    }

    if (options.include_synonymous) {
        merged.insert(merged.end(), silent_pool.begin(), silent_pool.end());
        diagnostics.synonymous_added = silent_pool.size();
    }

    std::vector<Variant> snvs;
    snvs.reserve(merged.size());

    for (auto& v : merged) {
        if (options.ignore_contigs.count(v.contig) > 0) {
            diagnostics.ignored_contig_variants++;
            continue;
        }

        v.contig = apply_contig_prefix(v.contig, options.contig_prefix, options.prefix_mode);

        if (v.variant_type != "SNP") {
            diagnostics.non_snp_removed++;
            continue;
        }
        if (!is_valid_snv_allele(v.reference_allele) || !is_valid_snv_allele(v.alternate_allele) ||
            v.reference_allele == v.alternate_allele) {
            diagnostics.malformed_alleles++;
            continue;
        }
        if (v.end_position < v.position) {
            v.end_position = v.position;
        }
        snvs.push_back(std::move(v));
    }

    diagnostics.prepared_variants = snvs.size();

    LOG_INFO("Variant preparation: " + std::to_string(variants.size()) + " main + " +
             std::to_string(silent_pool.size()) + " silent-pool rows -> " + std::to_string(snvs.size()) + " SNVs");
    LOG_DEBUG("  silent removed=" + std::to_string(diagnostics.silent_removed) +
              ", synonymous added=" + std::to_string(diagnostics.synonymous_added) +
              ", ignored contigs=" + std::to_string(diagnostics.ignored_contig_variants) +
              ", non-SNP=" + std::to_string(diagnostics.non_snp_removed) +
              ", malformed alleles=" + std::to_string(diagnostics.malformed_alleles));
    if (diagnostics.malformed_alleles > 0) {
        LOG_WARNING(std::to_string(diagnostics.malformed_alleles) +
                    " SNP rows have alleles outside A/C/G/T or REF == ALT and were skipped");
    }

    if (snvs.empty()) {
        throw FatalInputError("No single nucleotide variants left after filtering for SNP in Variant_Type field.");
    }

    return snvs;
}

}  // namespace TrinucMatrix
