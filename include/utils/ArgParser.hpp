#pragma once

#include <CLI/CLI.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

#include "core/Config.hpp"

namespace TrinucMatrix {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     *
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     *
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"TrinucMatrix - 96-class trinucleotide matrix and APOBEC enrichment from somatic SNVs"};

        // Input/Output
        app.add_option("-m,--maf", config.maf_path, "Path to MAF file, plain or gzipped (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-r,--reference", config.reference_fasta_path, "Path to indexed Reference FASTA (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output-dir", config.output_dir, "Output Directory (Default: output)");

        app.add_option("--basename", config.output_basename, "Output file name stem (Default: MAF file name)");

        // Variant preparation
        app.add_option("-p,--prefix", config.contig_prefix,
            "Prefix to add to or remove from contig names in the MAF (e.g. chr)");

        std::string prefix_mode_str = "add";
        app.add_option("--prefix-mode", prefix_mode_str, "How --prefix is applied: add, remove (Default: add)")
            ->check(CLI::IsMember({"add", "remove"}, CLI::ignore_case));

        app.add_option("--ignore-contigs", config.ignore_contigs, "Contigs to remove from analysis, e.g. chrM")
            ->expected(1, -1);

        app.add_flag("--use-syn,!--no-syn", config.use_syn,
            "Include synonymous variants in the analysis (Default: enabled)");

        // Enrichment
        app.add_option("--confidence-level", config.confidence_level,
            "Confidence level of the exact-test odds-ratio interval (Default: 0.95)")
            ->check(CLI::Range(0.0, 1.0));

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str,
            "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also write log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Help (ret=0) or error (ret>0): print message and stop.
            app.exit(e);
            return false;
        }

        static const std::map<std::string, LogLevel> log_level_map = {
            {"error", LogLevel::LOG_ERROR},
            {"warn", LogLevel::LOG_WARN},
            {"info", LogLevel::LOG_INFO},
            {"debug", LogLevel::LOG_DEBUG}
        };

        std::string log_lower = to_lower(log_level_str);
        auto it = log_level_map.find(log_lower);
        if (it != log_level_map.end()) {
            config.log_level = it->second;
        }

        config.prefix_mode = to_lower(prefix_mode_str) == "remove" ? PrefixMode::REMOVE : PrefixMode::ADD;

        return true;
    }

private:
    static std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }
};

} // namespace Utils
} // namespace TrinucMatrix
