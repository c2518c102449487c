#include "core/TrinucleotidePipeline.hpp"

#include <sstream>

#include "core/SubstitutionClassifier.hpp"
#include "utils/Logger.hpp"

namespace TrinucMatrix {

PipelineOptions PipelineOptions::from_config(const Config& config) {
    PipelineOptions options;
    options.prepare.include_synonymous = config.use_syn;
    options.prepare.ignore_contigs.insert(config.ignore_contigs.begin(), config.ignore_contigs.end());
    options.prepare.contig_prefix = config.contig_prefix;
    options.prepare.prefix_mode = config.prefix_mode;
    options.confidence_level = config.confidence_level;
    options.threads = config.threads;
    return options;
}

TrinucleotidePipeline::TrinucleotidePipeline(const SequenceProvider& reference, const PipelineOptions& options)
    : reference_(reference), options_(options) {
    std::stringstream ss;
    ss << "TrinucleotidePipeline initialized: threads=" << options_.threads
       << ", background=+/-" << options_.background_flank << "bp"
       << ", use_syn=" << (options_.prepare.include_synonymous ? "yes" : "no");
    if (!options_.prepare.contig_prefix.empty()) {
        ss << ", prefix=" << options_.prepare.contig_prefix << " ("
           << prefix_mode_to_string(options_.prepare.prefix_mode) << ")";
    }
    LOG_DEBUG(ss.str());
}

std::vector<ClassifiedVariant> TrinucleotidePipeline::classify(const std::vector<VariantContext>& contexts) {
    std::vector<ClassifiedVariant> classified;
    classified.reserve(contexts.size());
    for (const auto& vc : contexts) {
        ClassifiedVariant cv;
        cv.sample_id = vc.variant.sample_id;
        cv.contig = vc.variant.contig;
        cv.position = vc.variant.position;
        cv.context = vc.context;
        cv.record = SubstitutionClassifier::classify(vc.context.trinucleotide, vc.variant.reference_allele,
                                                     vc.variant.alternate_allele);
        classified.push_back(std::move(cv));
    }
    return classified;
}

PipelineResult TrinucleotidePipeline::run(const std::vector<Variant>& variants,
                                          const std::vector<Variant>& silent_pool) const {
    Utils::ScopedLogger run_scope("Trinucleotide matrix pipeline");
    PipelineResult result;

    std::vector<Variant> snvs;
    {
        Utils::ScopedLogger scope("Variant preparation", LogLevel::LOG_DEBUG);
        snvs = prepare_variants(variants, silent_pool, options_.prepare, result.diagnostics);
    }

    std::vector<VariantContext> contexts;
    {
        Utils::ScopedLogger scope("Extracting 5' and 3' adjacent bases and +/-" +
                                  std::to_string(options_.background_flank) + "bp background");
        ContextExtractor extractor(reference_, options_.background_flank, options_.threads);
        contexts = extractor.extract(snvs, result.diagnostics);
    }
    if (contexts.empty()) {
        throw FatalInputError("No variants left after reference context validation.");
    }

    std::vector<ClassifiedVariant> classified = classify(contexts);
    result.diagnostics.classified_variants = classified.size();

    Aggregator aggregator;
    aggregator.add_all(classified);
    LOG_INFO("Aggregated " + std::to_string(classified.size()) + " SNVs over " +
             std::to_string(aggregator.num_samples()) + " samples");

    {
        Utils::ScopedLogger scope("Estimating APOBEC enrichment scores");
        EnrichmentScorer scorer(options_.confidence_level, options_.threads);
        result.enrichment = scorer.score(aggregator.samples());
    }
    for (const auto& r : result.enrichment) {
        if (!r.ratio_defined()) {
            result.diagnostics.undefined_ratio_samples++;
        }
    }

    {
        Utils::ScopedLogger scope("Creating mutation matrix");
        MatrixBuilder builder;
        builder.add_aggregates(aggregator.samples());
        builder.finalize();
        result.matrix = builder.get_matrix();
    }

    return result;
}

void TrinucleotidePipeline::print_summary(const PipelineResult& result) {
    const PipelineDiagnostics& d = result.diagnostics;
    std::stringstream ss;
    ss << "\n=== Summary ===\n"
       << "  Input variants:            " << d.input_variants << " (+" << d.silent_pool_variants << " silent pool)\n"
       << "  Silent removed / added:    " << d.silent_removed << " / " << d.synonymous_added << "\n"
       << "  Ignored contig variants:   " << d.ignored_contig_variants << "\n"
       << "  Non-SNP removed:           " << d.non_snp_removed << "\n"
       << "  Malformed alleles:         " << d.malformed_alleles << "\n"
       << "  SNVs prepared:             " << d.prepared_variants << "\n"
       << "  Missing reference contigs: " << d.missing_contigs.size() << " (" << d.missing_contig_variants
       << " variants)\n"
       << "  Reference mismatches:      " << d.context_mismatches.size() << "\n"
       << "  SNVs classified:           " << d.classified_variants << "\n"
       << "  Samples:                   " << result.matrix.num_samples() << "\n"
       << "  Undefined ratios:          " << d.undefined_ratio_samples << "\n"
       << "===============";
    LOG_INFO(ss.str());
}

}  // namespace TrinucMatrix
