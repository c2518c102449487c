#include "io/ResultWriter.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/Logger.hpp"

namespace TrinucMatrix {

namespace {

const char* const kSubstitutions[] = {"A>C", "A>G", "A>T", "C>A", "C>G", "C>T",
                                      "G>A", "G>C", "G>T", "T>A", "T>C", "T>G"};

std::ofstream open_output(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    return ofs;
}

void close_output(std::ofstream& ofs, const std::string& path) {
    ofs.close();
    if (ofs.fail()) {
        throw std::runtime_error("Error while writing: " + path);
    }
}

}  // namespace

ResultWriter::ResultWriter(const std::string& output_dir, const std::string& basename)
    : output_dir_(output_dir), basename_(basename) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir_ + ": " + ec.message());
    }
}

std::string ResultWriter::format_double(double value) {
    if (std::isnan(value)) {
        return "NA";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Inf" : "-Inf";
    }
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

void ResultWriter::write_matrix(std::ostream& os, const SignatureMatrix& matrix) {
    os << "Sample";
    for (const auto& motif : matrix.motifs) {
        os << "\t" << motif;
    }
    os << "\n";

    for (int r = 0; r < matrix.num_samples(); ++r) {
        os << matrix.sample_ids[static_cast<size_t>(r)];
        for (int c = 0; c < matrix.num_classes(); ++c) {
            os << "\t" << matrix.counts(r, c);
        }
        os << "\n";
    }
}

void ResultWriter::write_enrichment(std::ostream& os, const std::vector<EnrichmentResult>& results) {
    os << "Sample";
    for (const char* s : kSubstitutions) {
        os << "\t" << s;
    }
    os << "\tn_A\tn_T\tn_G\tn_C\tn_mutations\tn_C>G_and_C>T"
       << "\ttCw_to_A\ttCw_to_T\ttCw_to_G\ttCw\twGa_to_C\twGa_to_T\twGa_to_A\twGa\ttCw_to_G+tCw_to_T"
       << "\tn_bg_A\tn_bg_T\tn_bg_G\tn_bg_C\tn_bg_tcw\tn_bg_wga\tn_bg_bases"
       << "\tAPOBEC_Enrichment\tnon_APOBEC_mutations\tfisher_pvalue\tor\tci_low\tci_high\tAPOBEC_Enriched\n";

    for (const auto& r : results) {
        const SampleAggregate& a = r.aggregate;
        os << r.sample_id;
        for (const char* s : kSubstitutions) {
            os << "\t" << a.substitution(s);
        }
        os << "\t" << a.n_a() << "\t" << a.n_t() << "\t" << a.n_g() << "\t" << a.n_c()
           << "\t" << a.n_mutations() << "\t" << a.apobec_mutations()
           << "\t" << a.tcw_to_a() << "\t" << a.tcw_to_t() << "\t" << a.tcw_to_g() << "\t" << a.tcw()
           << "\t" << a.wga_to_c() << "\t" << a.wga_to_t() << "\t" << a.wga_to_a() << "\t" << a.wga()
           << "\t" << a.tcw_wga_mutations()
           << "\t" << a.bg_a << "\t" << a.bg_t << "\t" << a.bg_g << "\t" << a.bg_c
           << "\t" << a.bg_tcw << "\t" << a.bg_wga << "\t" << a.bg_bases()
           << "\t" << format_double(r.apobec_enrichment_ratio) << "\t" << a.non_apobec_mutations()
           << "\t" << format_double(r.test.p_value) << "\t" << format_double(r.test.odds_ratio)
           << "\t" << format_double(r.test.ci_low) << "\t" << format_double(r.test.ci_high)
           << "\t" << (r.enriched ? "yes" : "no") << "\n";
    }
}

void ResultWriter::write_diagnostics(std::ostream& os, const PipelineDiagnostics& d) {
    os << "category\tkey\tvalue\n";
    os << "preparation\tinput_variants\t" << d.input_variants << "\n";
    os << "preparation\tsilent_pool_variants\t" << d.silent_pool_variants << "\n";
    os << "preparation\tsilent_removed\t" << d.silent_removed << "\n";
    os << "preparation\tsynonymous_added\t" << d.synonymous_added << "\n";
    os << "preparation\tignored_contig_variants\t" << d.ignored_contig_variants << "\n";
    os << "preparation\tnon_snp_removed\t" << d.non_snp_removed << "\n";
    os << "preparation\tmalformed_alleles\t" << d.malformed_alleles << "\n";
    os << "preparation\tprepared_variants\t" << d.prepared_variants << "\n";
    os << "contig_mismatch\tdropped_variants\t" << d.missing_contig_variants << "\n";
    for (const auto& contig : d.missing_contigs) {
        os << "contig_mismatch\tmissing_contig\t" << contig << "\n";
    }
    os << "context_integrity\tdropped_variants\t" << d.context_mismatches.size() << "\n";
    for (const auto& mm : d.context_mismatches) {
        os << "context_integrity\t" << mm.sample_id << ":" << mm.contig << ":" << mm.position << "\t"
           << "expected=" << mm.expected << ";observed=" << (mm.observed.empty() ? "." : mm.observed) << "\n";
    }
    os << "result\tclassified_variants\t" << d.classified_variants << "\n";
    os << "result\tundefined_ratio_samples\t" << d.undefined_ratio_samples << "\n";
}

void ResultWriter::write_matrix(const SignatureMatrix& matrix) const {
    const std::string path = matrix_path();
    std::ofstream ofs = open_output(path);
    write_matrix(ofs, matrix);
    close_output(ofs, path);
    LOG_INFO("Wrote " + path);
}

void ResultWriter::write_enrichment(const std::vector<EnrichmentResult>& results) const {
    const std::string path = enrichment_path();
    std::ofstream ofs = open_output(path);
    write_enrichment(ofs, results);
    close_output(ofs, path);
    LOG_INFO("Wrote " + path);
}

void ResultWriter::write_diagnostics(const PipelineDiagnostics& diagnostics) const {
    const std::string path = diagnostics_path();
    std::ofstream ofs = open_output(path);
    write_diagnostics(ofs, diagnostics);
    close_output(ofs, path);
    LOG_INFO("Wrote " + path);
}

void ResultWriter::write_all(const PipelineResult& result) const {
    write_matrix(result.matrix);
    write_enrichment(result.enrichment);
    write_diagnostics(result.diagnostics);
}

}  // namespace TrinucMatrix
