#include "logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>

#include <raylib.h>

namespace monotower::core {

namespace {

Logger* g_logger = nullptr;

// Indexed by raylib's TraceLogLevel (LOG_ALL .. LOG_NONE).
constexpr const char* kLevelNames[] = {"ALL", "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "NONE"};
constexpr int kLevelCount = static_cast<int>(sizeof(kLevelNames) / sizeof(kLevelNames[0]));

constexpr std::size_t kMaxLine = 1024;

// The core runs without a window, so timestamps come from a process-local clock
// instead of GetTime().
double seconds_since_start() {
    using clock = std::chrono::steady_clock;
    static const clock::time_point start = clock::now();
    return std::chrono::duration<double>(clock::now() - start).count();
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

const char* Logger::level_name(int logLevel) {
    if (logLevel < 0 || logLevel >= kLevelCount) return "INFO";
    return kLevelNames[logLevel];
}

std::string Logger::format_line(int logLevel, double seconds, const char* message) {
    char prefix[48];
    std::snprintf(prefix, sizeof(prefix), "[%.3f][%s]", seconds, level_name(logLevel));

    std::string line(prefix);
    const char* body = message ? message : "";

    // "[tag] rest" becomes part of the prefix; anything else is untagged.
    if (body[0] == '[') {
        const char* close = std::strchr(body, ']');
        if (close && close > body + 1 && close[1] == ' ') {
            line.append(body, static_cast<std::size_t>(close - body + 1));
            body = close + 2;
        }
    }

    line += ' ';
    line += body;
    return line;
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (!file_) {
            TraceLog(LOG_WARNING, "[log] cannot open %s, logging to stderr only", cfg.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
        callback_installed_ = false;
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }
}

void Logger::write_line_(const std::string& line) {
    std::fprintf(stderr, "%s\n", line.c_str());

    if (FILE* sink = static_cast<FILE*>(file_)) {
        std::fprintf(sink, "%s\n", line.c_str());
        std::fflush(sink);
    }
    ++lines_written_;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    char message[kMaxLine];
    std::vsnprintf(message, sizeof(message), text, args);

    const std::string line = format_line(logLevel, seconds_since_start(), message);
    if (g_logger) {
        g_logger->write_line_(line);
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

} // namespace monotower::core
