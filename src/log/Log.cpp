// SPDX-License-Identifier: BSD-2-Clause

#include "tickprobe/log/Log.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstring>
#include <utility>

namespace tickprobe {

namespace {

const char* level_color(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "\033[37m"; // white
        case LogLevel::DEBUG: return "\033[36m"; // cyan
        case LogLevel::INFO:  return "\033[32m"; // green
        case LogLevel::WARN:  return "\033[33m"; // yellow
        case LogLevel::ERROR: return "\033[31m"; // red
    }
    return "\033[0m";
}

std::string lowered(std::string value) {
    for (auto& ch : value) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return value;
}

} // namespace

/**
 * Open the requested backend.
 * If file mode is requested but the file cannot open, we fall back to stderr.
 */
Logger::Logger(const LoggerConfig& cfg, std::string tag)
    : level_{static_cast<int>(cfg.level)},
      mode_{cfg.mode},
      tag_{std::move(tag)} {
    if (mode_ == LogMode::File) {
        file_ = std::fopen(cfg.file_path.c_str(), "a");
        if (!file_) {
            mode_ = LogMode::Console;
        }
    }
}

Logger::~Logger() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

void Logger::log(LogLevel lvl, const char* fmt, ...) {
    // Fast path filter: skip log if below the active threshold
    if (!enabled(lvl)) {
        return;
    }

    va_list ap;
    va_start(ap, fmt);
    vlog(lvl, fmt, ap);
    va_end(ap);
}

std::vector<std::string> Logger::lines() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return lines_;
}

/**
 * Render and print a single log line: timestamp + level + tag + message.
 */
void Logger::vlog(LogLevel lvl, const char* fmt, va_list ap) {
    if (mode_ == LogMode::Silent) {
        return;
    }

    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, ap);
    // Strip a trailing newline; one is added on output.
    std::size_t len = std::strlen(msg);
    if (len > 0 && msg[len - 1] == '\n') msg[len - 1] = '\0';

    if (mode_ == LogMode::Buffer) {
        std::string line = std::string("[") + level_str(lvl) + "] ";
        if (!tag_.empty()) line += "[" + tag_ + "] ";
        line += msg;
        std::lock_guard<std::mutex> lk(mtx_);
        lines_.push_back(std::move(line));
        return;
    }

    FILE* out = (mode_ == LogMode::File && file_) ? file_ : stderr;

    // Current local timestamp in the form: YYYY-MM-DD HH:MM:SS
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    char ts[32];
    const int year = std::clamp(tm.tm_year + 1900, 0, 9999);
    const int mon  = std::clamp(tm.tm_mon + 1,     1,   12);
    const int day  = std::clamp(tm.tm_mday,        0,   31);
    const int hour = std::clamp(tm.tm_hour,        0,   23);
    const int min  = std::clamp(tm.tm_min,         0,   59);
    const int sec  = std::clamp(tm.tm_sec,         0,   59);
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d",
                  year, mon, day, hour, min, sec);

    std::lock_guard<std::mutex> lk(mtx_);

    const char* color = (mode_ == LogMode::Console) ? level_color(lvl) : "";
    const char* reset = (mode_ == LogMode::Console) ? "\033[0m" : "";

    if (tag_.empty()) {
        std::fprintf(out, "%s %s[%s]%s %s\n", ts, color, level_str(lvl), reset, msg);
    } else {
        std::fprintf(out, "%s %s[%s]%s [%s] %s\n", ts, color, level_str(lvl), reset, tag_.c_str(), msg);
    }
    std::fflush(out);
}

LoggerPtr make_logger(const LoggerConfig& cfg, std::string tag) {
    return std::make_shared<Logger>(cfg, std::move(tag));
}

LogLevel parse_log_level(const std::string& text) {
    const auto lvl = lowered(text);
    if (lvl == "trace") return LogLevel::TRACE;
    if (lvl == "debug") return LogLevel::DEBUG;
    if (lvl == "warn") return LogLevel::WARN;
    if (lvl == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

LogMode parse_log_mode(const std::string& text) {
    const auto mode = lowered(text);
    if (mode == "file") return LogMode::File;
    if (mode == "silent") return LogMode::Silent;
    if (mode == "buffer") return LogMode::Buffer;
    return LogMode::Console;
}

} // namespace tickprobe
