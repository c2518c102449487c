#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/Aggregator.hpp"
#include "core/Config.hpp"
#include "core/ContextExtractor.hpp"
#include "core/DataStructs.hpp"
#include "core/EnrichmentScorer.hpp"
#include "core/MatrixBuilder.hpp"
#include "core/SequenceProvider.hpp"
#include "core/VariantPreparer.hpp"

namespace TrinucMatrix {

/**
 * @brief Parameters of a pipeline run.
 */
struct PipelineOptions {
    PrepareOptions prepare;
    int64_t background_flank = 20;  ///< Background window is +/- this many bp
    double confidence_level = 0.95; ///< Exact-test confidence level
    int threads = 1;                ///< OpenMP threads (extraction and scoring)

    /**
     * @brief Options taken from a validated Config.
     */
    static PipelineOptions from_config(const Config& config);
};

/**
 * @brief Everything a run produces.
 */
struct PipelineResult {
    SignatureMatrix matrix;                   ///< Sample x 96 counts
    std::vector<EnrichmentResult> enrichment; ///< Sorted ascending by p-value
    PipelineDiagnostics diagnostics;
};

/**
 * @brief Runs preparation, context extraction, classification, aggregation,
 *        enrichment scoring and matrix building in one batch pass.
 *
 * Stages hand immutable results to the next one; nothing is shared across
 * stages except the caller-owned SequenceProvider.
 */
class TrinucleotidePipeline {
public:
    TrinucleotidePipeline(const SequenceProvider& reference, const PipelineOptions& options);

    /**
     * @brief Processes the main variant table and the silent pool.
     *
     * @throws FatalInputError when no variants are left at any stage.
     */
    PipelineResult run(const std::vector<Variant>& variants, const std::vector<Variant>& silent_pool = {}) const;

    /**
     * @brief Labels every extracted context.
     */
    static std::vector<ClassifiedVariant> classify(const std::vector<VariantContext>& contexts);

    /**
     * @brief Logs a short report of a finished run.
     */
    static void print_summary(const PipelineResult& result);

    const PipelineOptions& options() const { return options_; }

private:
    const SequenceProvider& reference_;
    PipelineOptions options_;
};

}  // namespace TrinucMatrix
