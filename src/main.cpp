#include <chrono>
#include <iostream>

#include "core/Config.hpp"
#include "core/TrinucleotidePipeline.hpp"
#include "io/MafReader.hpp"
#include "io/ResultWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/FastaReader.hpp"
#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

int main(int argc, char** argv) {
    TrinucMatrix::Utils::ResourceMonitor monitor;

    TrinucMatrix::Config config;

    if (!TrinucMatrix::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    // Configure Logger
    auto& logger = TrinucMatrix::Utils::Logger::instance();
    logger.set_log_level(config.log_level);
    if (!config.log_file.empty()) {
        logger.set_log_file(config.log_file);
    }

    if (!config.validate()) {
        LOG_ERROR("Configuration validation failed.");
        return 1;
    }

    config.print();

    LOG_INFO("Configuration valid. Starting analysis...");

    try {
        TrinucMatrix::Utils::ScopedLogger main_scope("Main Execution");

        TrinucMatrix::FastaReader reference(config.reference_fasta_path);

        LOG_INFO("[1] Loading variants from MAF...");
        TrinucMatrix::MafTable table;
        if (!table.load_from_maf(config.maf_path)) {
            LOG_ERROR("Failed to load MAF file. Exiting.");
            return 1;
        }

        LOG_INFO("[2] Processing " + std::to_string(table.size() + table.silent_size()) + " variants...");
        auto t_start = std::chrono::steady_clock::now();

        TrinucMatrix::TrinucleotidePipeline pipeline(reference, TrinucMatrix::PipelineOptions::from_config(config));
        TrinucMatrix::PipelineResult result = pipeline.run(table.all(), table.silent());

        auto t_end = std::chrono::steady_clock::now();
        double total_time = std::chrono::duration<double, std::milli>(t_end - t_start).count();

        LOG_INFO("[3] Writing results...");
        TrinucMatrix::ResultWriter writer(config.output_dir, config.get_output_basename());
        writer.write_all(result);

        std::cout << "[4] Analysis Complete." << std::endl;
        TrinucMatrix::TrinucleotidePipeline::print_summary(result);

        LOG_INFO("Total Wall-clock time: " + std::to_string(total_time) + " ms");
        LOG_INFO("Output directory: " + config.output_dir);

    } catch (const TrinucMatrix::FatalInputError& e) {
        LOG_ERROR("Input error: " + std::string(e.what()));
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    monitor.print_stats("Total Execution");

    return 0;
}
