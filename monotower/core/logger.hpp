#pragma once

#include "config.hpp"

#include <cstdarg>
#include <cstddef>
#include <string>

namespace monotower::core {

// Routes raylib TraceLog output. Every line goes to stderr, and to the
// configured file when one is open, as "[seconds][LEVEL][tag] message"
// where the tag is lifted from a leading "[tag] " in the message.
class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool has_file_sink() const { return file_ != nullptr; }
    std::size_t lines_written() const { return lines_written_; }

    static const char* level_name(int logLevel);
    static std::string format_line(int logLevel, double seconds, const char* message);

private:
    Logger() = default;

    void write_line_(const std::string& line);

    void* file_{nullptr};
    bool callback_installed_{false};
    std::size_t lines_written_{0};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace monotower::core
