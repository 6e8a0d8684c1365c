#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace MiteSeq {
namespace Utils {

/**
 * @brief Process-wide logger.
 *
 * Messages at or below the configured verbosity go to the console (stdout for
 * info/debug, stderr for warnings/errors), colored when the stream is a terminal,
 * and are mirrored without colors to an optional log file.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel log_level() const { return current_level_; }

    /**
     * @brief Appends all further messages to the given file, creating parent directories.
     * @return false if the file can't be opened.
     */
    bool set_log_file(const std::string& filename);

    void set_use_color(bool use_color);

    /**
     * @brief Parses "error", "warn", "info" or "debug" (case-sensitive).
     * @throws std::invalid_argument on anything else.
     */
    static LogLevel parse_level(const std::string& name);

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    /// Number of messages emitted at the given level since startup.
    int64_t message_count(LogLevel level) const;

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    bool use_color_ = true;
    std::ofstream log_file_;
    mutable std::mutex mutex_;
    std::array<int64_t, 4> message_counts_{};

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief RAII helper to log start and end of a pipeline phase with its wall time.
 */
class ScopedLogger {
public:
    explicit ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

    ScopedLogger(const ScopedLogger&) = delete;
    ScopedLogger& operator=(const ScopedLogger&) = delete;

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace MiteSeq

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) MiteSeq::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) MiteSeq::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) MiteSeq::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) MiteSeq::Utils::Logger::error(msg, __FILE__, __LINE__)
