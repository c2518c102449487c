#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/DataStructs.hpp"
#include "core/EnrichmentScorer.hpp"
#include "core/MatrixBuilder.hpp"
#include "core/TrinucleotidePipeline.hpp"

namespace TrinucMatrix {

/**
 * @brief Writes the pipeline outputs as TSV files.
 *
 * Output layout:
 * ```
 * output/
 *   <basename>.trinucleotide_matrix.tsv   # Sample x 96 classes, canonical column order
 *   <basename>.apobec_enrichment.tsv      # Per-sample counts, ratio, exact test, label
 *   <basename>.diagnostics.tsv            # Dropped variants by category
 * ```
 *
 * Undefined numbers (NaN) are written as "NA", infinities as "Inf".
 */
class ResultWriter {
public:
    /**
     * @param output_dir Output directory, created if missing.
     * @param basename File name stem.
     * @throws std::runtime_error if the directory cannot be created.
     */
    ResultWriter(const std::string& output_dir, const std::string& basename);

    /**
     * @brief Writes all three files.
     * @throws std::runtime_error if any file cannot be written.
     */
    void write_all(const PipelineResult& result) const;

    void write_matrix(const SignatureMatrix& matrix) const;
    void write_enrichment(const std::vector<EnrichmentResult>& results) const;
    void write_diagnostics(const PipelineDiagnostics& diagnostics) const;

    // Stream variants, used by the file writers and by tests
    static void write_matrix(std::ostream& os, const SignatureMatrix& matrix);
    static void write_enrichment(std::ostream& os, const std::vector<EnrichmentResult>& results);
    static void write_diagnostics(std::ostream& os, const PipelineDiagnostics& diagnostics);

    /**
     * @brief Formats a double for TSV output ("NA" for NaN, "Inf" for +inf).
     */
    static std::string format_double(double value);

    std::string matrix_path() const { return output_dir_ + "/" + basename_ + ".trinucleotide_matrix.tsv"; }
    std::string enrichment_path() const { return output_dir_ + "/" + basename_ + ".apobec_enrichment.tsv"; }
    std::string diagnostics_path() const { return output_dir_ + "/" + basename_ + ".diagnostics.tsv"; }

private:
    std::string output_dir_;
    std::string basename_;
};

}  // namespace TrinucMatrix
