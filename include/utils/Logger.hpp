#pragma once

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace TrinucMatrix {
namespace Utils {

/**
 * @brief Singleton Logger shared by every pipeline stage.
 *
 * Messages go to stdout (colored by level) and, when set_log_file() has been
 * called, to a plain-text log file.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return current_level_; }
    void set_log_file(const std::string& filename);
    void set_color(bool enabled);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool use_color_ = true;
    std::ofstream log_file_;
    std::mutex mutex_;

    std::string level_to_string(LogLevel level);
    std::string get_color_code(LogLevel level);
    std::string reset_color_code();
};

/**
 * @brief RAII helper to log start and end of a pipeline stage.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

    ScopedLogger(const ScopedLogger&) = delete;
    ScopedLogger& operator=(const ScopedLogger&) = delete;

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace TrinucMatrix

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) TrinucMatrix::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) TrinucMatrix::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) TrinucMatrix::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) TrinucMatrix::Utils::Logger::error(msg, __FILE__, __LINE__)
