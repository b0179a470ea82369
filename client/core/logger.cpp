#include "logger.hpp"

#include <chrono>
#include <cstdio>

#include <raylib.h>

namespace core {

namespace {

Logger* g_logger = nullptr;

// Seconds since the first log line; the headless build has no raylib window clock.
double elapsed_seconds() {
    using Clock = std::chrono::steady_clock;
    static const Clock::time_point start = Clock::now();
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void write_line(std::FILE* out, double t, const char* level, const char* text, va_list args) {
    std::fprintf(out, "[%.3f][%s] ", t, level);
    std::vfprintf(out, text, args);
    std::fputc('\n', out);
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

const char* Logger::level_name(int logLevel) {
    switch (logLevel) {
        case LOG_ALL: return "ALL";
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        case LOG_NONE: return "NONE";
        default: return "INFO";
    }
}

bool Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return true;
    }

    SetTraceLogLevel(cfg.level);
    SetTraceLogCallback(&Logger::trace_callback);
    callback_installed_ = true;

    if (cfg.file.empty()) {
        return true;
    }

    file_ = std::fopen(cfg.file.c_str(), "a");
    if (!file_) {
        TraceLog(LOG_WARNING, "[log] cannot open log file '%s'; logging to stderr only", cfg.file.c_str());
        return false;
    }

    path_ = cfg.file;
    TraceLog(LOG_INFO, "[log] writing to %s", path_.c_str());
    return true;
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<std::FILE*>(file_));
        file_ = nullptr;
    }

    path_.clear();
    callback_installed_ = false;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    const char* level = level_name(logLevel);
    const double t = elapsed_seconds();

    std::FILE* sink = g_logger ? static_cast<std::FILE*>(g_logger->file_) : nullptr;
    if (!sink) {
        write_line(stderr, t, level, text, args);
        return;
    }

    va_list args_copy;
    va_copy(args_copy, args);

    write_line(sink, t, level, text, args);
    std::fflush(sink);
    write_line(stderr, t, level, text, args_copy);

    va_end(args_copy);
}

} // namespace core
