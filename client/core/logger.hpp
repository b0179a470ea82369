#pragma once

#include "config.hpp"

#include <cstdarg>
#include <string>

namespace core {

// Routes raylib TraceLog output to stderr and, when configured, to an append-only file.
// Every line is prefixed with the elapsed time and the level name.
class Logger {
public:
    static Logger& instance();

    // Applies [logging] settings. Returns false when the file sink could not be opened;
    // stderr logging stays active in that case.
    bool init(const LoggingConfig& cfg);
    void shutdown();

    const std::string& file_path() const { return path_; }
    bool has_file_sink() const { return file_ != nullptr; }

    static const char* level_name(int logLevel);

private:
    Logger() = default;

    void* file_{nullptr};
    std::string path_{};
    bool callback_installed_{false};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace core
