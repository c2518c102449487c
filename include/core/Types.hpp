#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace TrinucMatrix {

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,    ///< Only errors
    LOG_WARN = 1,     ///< Errors and warnings
    LOG_INFO = 2,     ///< Normal operational messages
    LOG_DEBUG = 3     ///< Detailed debug output including per-variant diagnostics
};

/**
 * @brief How a contig-name prefix is applied to variant contigs.
 *
 * - ADD: prefix is prepended ("1" -> "chr1")
 * - REMOVE: every literal occurrence of the prefix is deleted ("chr1" -> "1")
 */
enum class PrefixMode : uint8_t {
    ADD = 0,
    REMOVE = 1
};

inline std::string prefix_mode_to_string(PrefixMode mode) {
    switch (mode) {
        case PrefixMode::ADD: return "add";
        case PrefixMode::REMOVE: return "remove";
        default: return "unknown";
    }
}

/**
 * @brief Raised when the input cannot produce any output.
 *
 * Thrown when no SNVs survive preparation, when every variant sits on a
 * contig the reference does not know, or when context validation rejects
 * all remaining variants. Processing stops with no partial output.
 */
class FatalInputError : public std::runtime_error {
public:
    explicit FatalInputError(const std::string& message)
        : std::runtime_error(message) {
    }
};

/**
 * @brief True for the four unambiguous nucleotides (uppercase only).
 */
inline bool is_nucleotide(char base) {
    return base == 'A' || base == 'C' || base == 'G' || base == 'T';
}

}  // namespace TrinucMatrix
