//! # enumgen Logging
//!
//! Leveled, module-tagged diagnostics for the generator stages. Records go
//! to every attached sink; the CLI attaches a `ConsoleSink` writing to
//! stderr, tests attach a `MemorySink`.
//!
//! ```cpp
//! ENUMGEN_LOG_INFO("registry", "Loaded " << path << " (" << n << " enum blocks)");
//! ENUMGEN_LOG_DEBUG("assemble", "Skipping " << name << ": unknown type " << extends);
//! ```
//!
//! | Tag        | Stage                              |
//! |------------|------------------------------------|
//! | `registry` | XML loading                        |
//! | `resolve`  | Value resolution                   |
//! | `assemble` | Pass ordering, unknown references  |
//! | `emit`     | Header and source rendering        |
//! | `cli`      | Argument parsing and file output   |
//!
//! Messages below `ENUMGEN_MIN_LOG_LEVEL` are compiled out.

#ifndef ENUMGEN_LOG_HPP
#define ENUMGEN_LOG_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace enumgen::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Every resolved enumerator
    Debug = 1, ///< Per-declaration decisions
    Info = 2,  ///< Per-document summaries
    Warn = 3,  ///< Suspicious but tolerated input
    Error = 4, ///< The error that stops a run
    Fatal = 5,
    Off = 6
};

/// Lowercase name used in console output ("debug", "error", ...).
const char* level_name(LogLevel level);

struct LogRecord {
    LogLevel level;
    std::string module;
    std::string message;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes `enumgen: <level>: [<module>] <message>` lines to stderr. The
/// level is colored when `use_colors` is set and stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_;
};

/// Keeps every record, for assertions in tests.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records_.push_back(record);
    }
    void flush() override {}

    const std::vector<LogRecord>& records() const {
        return records_;
    }

    /// Number of records at `level` tagged with `module`.
    size_t count(LogLevel level, std::string_view module) const;

private:
    std::vector<LogRecord> records_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool console = true; ///< Attach a ConsoleSink
    bool colors = true;
};

/// Process-wide logger. Starts with a console sink at Warn until `init()`
/// is called.
class Logger {
public:
    /// Replaces the level and every sink.
    static void init(const LogConfig& config);

    static Logger& instance();

    bool should_log(LogLevel level) const {
        return level >= level_;
    }

    void log(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    std::mutex mutex_;
};

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 6=Off
#ifndef ENUMGEN_MIN_LOG_LEVEL
#define ENUMGEN_MIN_LOG_LEVEL 0
#endif

#define ENUMGEN_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= ENUMGEN_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::enumgen::log::Logger::instance();                                    \
            if (logger_.should_log(level)) {                                                       \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str());                                        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define ENUMGEN_LOG_TRACE(module, msg) ENUMGEN_LOG_IMPL(::enumgen::log::LogLevel::Trace, module, msg)
#define ENUMGEN_LOG_DEBUG(module, msg) ENUMGEN_LOG_IMPL(::enumgen::log::LogLevel::Debug, module, msg)
#define ENUMGEN_LOG_INFO(module, msg) ENUMGEN_LOG_IMPL(::enumgen::log::LogLevel::Info, module, msg)
#define ENUMGEN_LOG_WARN(module, msg) ENUMGEN_LOG_IMPL(::enumgen::log::LogLevel::Warn, module, msg)
#define ENUMGEN_LOG_ERROR(module, msg) ENUMGEN_LOG_IMPL(::enumgen::log::LogLevel::Error, module, msg)
#define ENUMGEN_LOG_FATAL(module, msg) ENUMGEN_LOG_IMPL(::enumgen::log::LogLevel::Fatal, module, msg)

} // namespace enumgen::log

#endif // ENUMGEN_LOG_HPP
