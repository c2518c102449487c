#include "core/ContextExtractor.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace TrinucMatrix {

namespace {

enum class ContextStatus : uint8_t {
    OK = 0,
    MISMATCH = 1,
    MISSING_CONTIG = 2
};

/**
 * @brief Slices [start, end] (1-based, inclusive) out of a fetched span,
 *        clipping the request to [1, contig_len].
 */
std::string slice_span(const std::string& span, int64_t span_start, int64_t start, int64_t end, int64_t contig_len) {
    start = std::max<int64_t>(start, 1);
    end = std::min(end, contig_len);
    if (end < start) {
        return "";
    }
    return span.substr(static_cast<size_t>(start - span_start), static_cast<size_t>(end - start + 1));
}

bool is_valid_context(const std::string& trinucleotide, const std::string& ref) {
    return trinucleotide.size() == 3 && ref.size() == 1 && trinucleotide[1] == ref[0] &&
           is_nucleotide(trinucleotide[0]) && is_nucleotide(trinucleotide[2]);
}

}  // namespace

ContextExtractor::ContextExtractor(const SequenceProvider& provider, int64_t background_flank, int num_threads)
    : provider_(provider), background_flank_(background_flank), num_threads_(std::max(1, num_threads)) {
}

void ContextExtractor::count_background(SequenceContext& context) {
    const std::string& w = context.background;
    context.count_a = context.count_c = context.count_g = context.count_t = 0;
    context.count_tca = context.count_tct = context.count_aga = context.count_tga = 0;

    std::string upper(w.size(), 'N');
    for (size_t i = 0; i < w.size(); ++i) {
        upper[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(w[i])));
        switch (upper[i]) {
            case 'A': context.count_a++; break;
            case 'C': context.count_c++; break;
            case 'G': context.count_g++; break;
            case 'T': context.count_t++; break;
            default: break;
        }
    }

    for (size_t i = 0; i + 3 <= upper.size(); ++i) {
        const char a = upper[i], b = upper[i + 1], c = upper[i + 2];
        if (a == 'T' && b == 'C' && c == 'A') context.count_tca++;
        else if (a == 'T' && b == 'C' && c == 'T') context.count_tct++;
        else if (a == 'A' && b == 'G' && c == 'A') context.count_aga++;
        else if (a == 'T' && b == 'G' && c == 'A') context.count_tga++;
    }
}

std::vector<VariantContext> ContextExtractor::extract(const std::vector<Variant>& snvs,
                                                      PipelineDiagnostics& diagnostics) const {
    const size_t n = snvs.size();
    std::vector<VariantContext> slots(n);
    std::vector<ContextStatus> status(n, ContextStatus::OK);

    // Group variant indices by contig
    std::map<std::string, std::vector<size_t>> by_contig;
    for (size_t i = 0; i < n; ++i) {
        by_contig[snvs[i].contig].push_back(i);
    }

    // Contig validation against the reference
    const std::set<std::string> known = provider_.list_contigs();
    std::vector<std::string> missing;
    size_t missing_variants = 0;
    for (const auto& kv : by_contig) {
        if (known.count(kv.first) == 0) {
            missing.push_back(kv.first);
            missing_variants += kv.second.size();
            for (size_t idx : kv.second) {
                status[idx] = ContextStatus::MISSING_CONTIG;
            }
        }
    }

    diagnostics.missing_contigs = missing;
    diagnostics.missing_contig_variants = missing_variants;

    if (!missing.empty()) {
        std::stringstream ss;
        ss << "Contig names in MAF must match contig names in the reference. Ignoring " << missing_variants
           << " single nucleotide variants from: ";
        for (size_t i = 0; i < missing.size(); ++i) {
            ss << (i > 0 ? ", " : "") << missing[i];
        }
        LOG_WARNING(ss.str());
    }

    if (n > 0 && missing_variants == n) {
        throw FatalInputError("None of the variant contigs are present in the reference; no variants left.");
    }

    for (const auto& kv : by_contig) {
        const std::string& contig = kv.first;
        const std::vector<size_t>& indices = kv.second;
        if (status[indices.front()] == ContextStatus::MISSING_CONTIG) {
            continue;
        }

        const int64_t contig_len = provider_.contig_length(contig);

        // One fetch per contig covering every window on it
        int64_t span_start = contig_len;
        int64_t span_end = 1;
        for (size_t idx : indices) {
            const Variant& v = snvs[idx];
            span_start = std::min(span_start, v.position - background_flank_);
            span_end = std::max(span_end, v.end_position + background_flank_);
        }
        span_start = std::max<int64_t>(span_start, 1);
        span_end = std::min(span_end, contig_len);

        std::string span;
        if (span_start <= span_end) {
            span = provider_.get_sequence(contig, span_start, span_end);
            if (static_cast<int64_t>(span.size()) != span_end - span_start + 1) {
                throw std::runtime_error("Failed to fetch reference sequence " + contig + ":" +
                                         std::to_string(span_start) + "-" + std::to_string(span_end));
            }
        }

        LOG_DEBUG("Fetched " + contig + ":" + std::to_string(span_start) + "-" + std::to_string(span_end) + " for " +
                  std::to_string(indices.size()) + " variants");

        const int64_t count = static_cast<int64_t>(indices.size());
#pragma omp parallel for schedule(static) num_threads(num_threads_)
        for (int64_t k = 0; k < count; ++k) {
            const size_t idx = indices[static_cast<size_t>(k)];
            const Variant& v = snvs[idx];
            VariantContext& out = slots[idx];
            out.variant = v;

            if (span.empty() || v.position > contig_len) {
                status[idx] = ContextStatus::MISMATCH;
                continue;
            }

            out.context.trinucleotide = slice_span(span, span_start, v.position - 1, v.position + 1, contig_len);
            out.context.background = slice_span(span, span_start, v.position - background_flank_,
                                                v.end_position + background_flank_, contig_len);

            if (!is_valid_context(out.context.trinucleotide, v.reference_allele)) {
                status[idx] = ContextStatus::MISMATCH;
                continue;
            }
            count_background(out.context);
        }
    }

    std::vector<VariantContext> extracted;
    extracted.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (status[i] == ContextStatus::OK) {
            extracted.push_back(std::move(slots[i]));
        } else if (status[i] == ContextStatus::MISMATCH) {
            ContextMismatch mm;
            mm.sample_id = snvs[i].sample_id;
            mm.contig = snvs[i].contig;
            mm.position = snvs[i].position;
            mm.expected = snvs[i].reference_allele;
            mm.observed = slots[i].context.trinucleotide;
            diagnostics.context_mismatches.push_back(mm);
        }
    }

    const auto& mismatches = diagnostics.context_mismatches;
    if (!mismatches.empty()) {
        const size_t shown = std::min<size_t>(mismatches.size(), 10);
        for (size_t i = 0; i < shown; ++i) {
            const auto& mm = mismatches[i];
            LOG_WARNING("Reference mismatch " + mm.sample_id + " " + mm.contig + ":" + std::to_string(mm.position) +
                        " expected " + mm.expected + ", reference context '" + mm.observed + "'");
        }
        LOG_WARNING(std::to_string(mismatches.size()) +
                    " variants excluded: reference base does not match the genome or context is incomplete");
    }

    LOG_INFO("Extracted contexts for " + std::to_string(extracted.size()) + " of " + std::to_string(n) +
             " SNVs across " + std::to_string(by_contig.size() - missing.size()) + " contigs");

    return extracted;
}

}  // namespace TrinucMatrix
