#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace TrinucMatrix {
namespace Utils {

/**
 * @brief Wall-clock and memory accounting for a run or a single test.
 *
 * With jemalloc the currently allocated bytes are reported; otherwise the
 * process peak RSS from getrusage() is used.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    // Returns memory usage in bytes
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));
        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#else
        struct rusage usage;
        if (getrusage(RUSAGE_SELF, &usage) == 0) {
            // ru_maxrss is reported in kilobytes on Linux
            allocated = static_cast<size_t>(usage.ru_maxrss) * 1024;
        }
#endif
        return allocated;
    }

    void print_stats(const std::string& label = "Execution") const {
        double time = get_elapsed_seconds();
        size_t mem = get_memory_usage();

        std::cout << "[" << label << "] ";
        std::cout << "Time: " << std::fixed << std::setprecision(4) << time << " s";
#ifdef USE_JEMALLOC
        std::cout << ", Allocated: ";
#else
        std::cout << ", Peak RSS: ";
#endif
        std::cout << std::fixed << std::setprecision(2) << (mem / 1024.0 / 1024.0) << " MB" << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace TrinucMatrix
