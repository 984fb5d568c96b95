// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Log.h
 * @brief Small thread-safe logger instances with levels and backends.
 *
 * Usage:
 *   auto log = tickprobe::make_logger({ .level = LogLevel::INFO,
 *                                       .mode  = LogMode::Console }, "server");
 *
 *   TPLOG_INFO(log, "Hello %s", "world");
 *
 * Levels: TRACE < DEBUG < INFO < WARN < ERROR
 * Modes : Console, File, Silent, Buffer
 *
 * Every role loop owns (or shares) its own Logger, so several roles can run in
 * one process with independent levels and sinks.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tickprobe {

/**
 * @brief Logging severity levels in increasing order.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4
};

/**
 * @brief Output backends supported by the logger.
 */
enum class LogMode {
    Console,  ///< Log to stderr with a coloured level tag.
    File,     ///< Append to a configured file.
    Silent,   ///< Discard all log messages.
    Buffer    ///< Keep rendered lines in memory (see Logger::lines()).
};

/**
 * @brief Configuration passed to the Logger constructor.
 */
struct LoggerConfig {
    LogLevel level = LogLevel::INFO;      ///< Minimum severity to emit.
    LogMode  mode  = LogMode::Console;    ///< Output backend.
    std::string file_path{};              ///< Used when mode == File.
};

/**
 * @brief Leveled printf-style logger.
 *
 *  - The level is an atomic so hot paths can check it without locking.
 *  - Emission is serialised by a per-instance mutex.
 */
class Logger {
public:
    /**
     * @brief Open the backend described by @p cfg.
     *
     * If mode == File and the file cannot be opened, the logger falls back to
     * Console mode.
     *
     * @param tag Short label printed on every line (e.g. "server").
     */
    explicit Logger(const LoggerConfig& cfg, std::string tag = {});
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// Override the minimum level. Safe to call concurrently.
    void set_level(LogLevel lvl);

    /// Current minimum level.
    LogLevel level() const;

    /// True when messages at @p lvl would be emitted.
    bool enabled(LogLevel lvl) const {
        return static_cast<int>(lvl) >= level_.load(std::memory_order_relaxed);
    }

    /// Effective backend (may differ from the requested one after a fallback).
    LogMode mode() const { return mode_; }

    const std::string& tag() const { return tag_; }

    /**
     * @brief Emit a formatted log message.
     *
     * Callers must ensure the format string matches the arguments.
     */
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;

    /// Copy of the lines captured so far in Buffer mode (without timestamps).
    std::vector<std::string> lines() const;

    /// Map a LogLevel to its label (e.g. "INFO").
    static const char* level_str(LogLevel lvl);

private:
    void vlog(LogLevel lvl, const char* fmt, va_list ap);

    mutable std::mutex mtx_;           ///< Serialises writes to the backend.
    std::atomic<int> level_;           ///< Current minimum level as an int.
    LogMode mode_;                     ///< Effective output mode.
    FILE* file_ = nullptr;             ///< Owned FILE* when mode == File.
    std::string tag_;
    std::vector<std::string> lines_;   ///< Captured lines in Buffer mode.
};

using LoggerPtr = std::shared_ptr<Logger>;

/// Convenience factory for a shared logger instance.
LoggerPtr make_logger(const LoggerConfig& cfg, std::string tag = {});

/// Parse "trace|debug|info|warn|error" (case-insensitive); INFO otherwise.
LogLevel parse_log_level(const std::string& text);

/// Parse "console|file|silent|buffer" (case-insensitive); Console otherwise.
LogMode parse_log_mode(const std::string& text);

// -----------------------------------------------------------------------------
// Convenience macros
// -----------------------------------------------------------------------------

/**
 * @brief Check whether @p lvl is enabled on @p logger (null loggers are silent).
 *
 * Avoids formatting arguments when the level is below the threshold.
 */
#define TPLOG_ENABLED(logger, lvl) \
    ((logger) && (logger)->enabled(tickprobe::LogLevel::lvl))

#define TPLOG_TRACE(logger, fmt, ...) \
    do { \
        if (TPLOG_ENABLED(logger, TRACE)) { \
            (logger)->log(tickprobe::LogLevel::TRACE, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define TPLOG_DEBUG(logger, fmt, ...) \
    do { \
        if (TPLOG_ENABLED(logger, DEBUG)) { \
            (logger)->log(tickprobe::LogLevel::DEBUG, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define TPLOG_INFO(logger, fmt, ...) \
    do { \
        if (TPLOG_ENABLED(logger, INFO)) { \
            (logger)->log(tickprobe::LogLevel::INFO, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define TPLOG_WARN(logger, fmt, ...) \
    do { \
        if (TPLOG_ENABLED(logger, WARN)) { \
            (logger)->log(tickprobe::LogLevel::WARN, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define TPLOG_ERROR(logger, fmt, ...) \
    do { \
        if (TPLOG_ENABLED(logger, ERROR)) { \
            (logger)->log(tickprobe::LogLevel::ERROR, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

} // namespace tickprobe
