//! # Logger Implementation

#include "log/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define ENUMGEN_ISATTY(fd) _isatty(fd)
#define ENUMGEN_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define ENUMGEN_ISATTY(fd) isatty(fd)
#define ENUMGEN_FILENO(f) fileno(f)
#endif

namespace enumgen::log {

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "trace";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warning";
    case LogLevel::Error:
        return "error";
    case LogLevel::Fatal:
        return "fatal";
    case LogLevel::Off:
        break;
    }
    return "off";
}

// ============================================================================
// Sinks
// ============================================================================

namespace {

bool stderr_is_color_terminal() {
    if (!ENUMGEN_ISATTY(ENUMGEN_FILENO(stderr)))
        return false;
#ifdef _WIN32
    return true;
#else
    const char* term = std::getenv("TERM");
    return term && std::strcmp(term, "dumb") != 0;
#endif
}

const char* color_of(LogLevel level) {
    if (level >= LogLevel::Error)
        return "\033[1;31m";
    if (level == LogLevel::Warn)
        return "\033[1;33m";
    return "\033[2m";
}

} // namespace

ConsoleSink::ConsoleSink(bool use_colors) : colors_(use_colors && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::ostringstream line;
    line << "enumgen: ";
    if (colors_)
        line << color_of(record.level) << level_name(record.level) << "\033[0m";
    else
        line << level_name(record.level);
    line << ": [" << record.module << "] " << record.message << "\n";
    std::cerr << line.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

size_t MemorySink::count(LogLevel level, std::string_view module) const {
    size_t n = 0;
    for (const auto& record : records_) {
        if (record.level == level && record.module == module)
            ++n;
    }
    return n;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>(true));
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.level_ = config.level;
    logger.sinks_.clear();
    if (config.console)
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.colors));
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record{level, std::string(module), std::move(message)};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_)
        sink->write(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_)
        sink->flush();
}

} // namespace enumgen::log
