#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "Types.hpp"

namespace TrinucMatrix {

/**
 * @brief Configuration structure holding all runtime parameters.
 *
 * Populated by CLI11 (basic checks) and checked by validate() (file formats
 * and cross-field logic).
 */
struct Config {
    // Input/Output
    std::string maf_path;               ///< Path to MAF file, plain or gzipped (Required)
    std::string reference_fasta_path;   ///< Path to indexed reference FASTA (Required)
    std::string output_dir = "output";  ///< Output directory for results
    std::string output_basename;        ///< File name stem; empty = MAF file stem

    // Variant preparation
    std::string contig_prefix;                ///< Prefix to add to / remove from MAF contig names
    PrefixMode prefix_mode = PrefixMode::ADD; ///< How contig_prefix is applied
    std::vector<std::string> ignore_contigs;  ///< Contigs to exclude (e.g. chrM)
    bool use_syn = true;                      ///< Include synonymous (silent) variants

    // Enrichment
    double confidence_level = 0.95;  ///< Confidence level of the exact-test interval

    int threads = 1;  ///< Number of OpenMP threads

    // Logging
    LogLevel log_level = LogLevel::LOG_INFO;  ///< Logging verbosity level
    std::string log_file;                     ///< Optional log file (in addition to stdout)

    /**
     * @brief Validates configuration logic and file formats.
     *
     * Opens the MAF and the FASTA index with htslib and checks option ranges.
     * Every problem is printed; validation does not stop at the first one.
     *
     * @return true if configuration is valid, false otherwise.
     */
    bool validate() const;

    /**
     * @brief Prints the current configuration to stdout.
     */
    void print() const;

    /**
     * @brief Effective output basename (MAF stem without .maf/.gz).
     */
    std::string get_output_basename() const;

    bool is_debug() const {
        return log_level >= LogLevel::LOG_DEBUG;
    }
};

}  // namespace TrinucMatrix
