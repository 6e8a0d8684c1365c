#pragma once

#include <sys/resource.h>

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace MiteSeq {
namespace Utils {

/**
 * @brief Wall time and memory of a pipeline phase or a test.
 *
 * Live heap size comes from jemalloc when it is linked in (USE_JEMALLOC);
 * peak resident size always comes from getrusage.
 */
class ResourceMonitor {
public:
    ResourceMonitor() { reset(); }

    void reset() { start_time_ = std::chrono::steady_clock::now(); }

    double get_elapsed_seconds() const {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time_;
        return elapsed.count();
    }

    /// Bytes currently allocated through jemalloc, 0 without it.
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // stats are cached until the epoch is advanced
        uint64_t epoch = 1;
        if (mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch)) != 0 ||
            mallctl("stats.allocated", &allocated, &sz, nullptr, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    /// Peak resident set size of the process in bytes.
    static size_t get_peak_rss() {
        struct rusage usage {};
        if (getrusage(RUSAGE_SELF, &usage) != 0) {
            return 0;
        }
        return static_cast<size_t>(usage.ru_maxrss) * 1024;  // Linux reports KiB
    }

    /// One-line summary, e.g. "[Label] Time: 1.2345 s, Peak RSS: 12.00 MB".
    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream ss;
        ss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        ss << ", Heap: " << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
#endif
        ss << ", Peak RSS: " << std::setprecision(2) << (get_peak_rss() / 1024.0 / 1024.0) << " MB";
        return ss.str();
    }

    void print_stats(const std::string& label = "Execution", std::ostream& os = std::cout) const {
        os << format_stats(label) << std::endl;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace MiteSeq
