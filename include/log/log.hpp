//! # doclink Logging
//!
//! Module-tagged diagnostics for the link migration tool. Records go to
//! stderr by default and optionally to a file, as text or one JSON object
//! per line. Per-link issues belong in the run report, not here.
//!
//! ```cpp
//! DOCLINK_LOG_INFO("scan", "Scanning " << root);
//! DOCLINK_LOG_DEBUG("plan", original << " -> " << replacement);
//! DOCLINK_LOG_WARN("nav", "Stale navigation entry " << path);
//! ```
//!
//! ## Module Tags
//!
//! | Tag     | Component                 |
//! |---------|---------------------------|
//! | `scan`  | Link scanner              |
//! | `plan`  | Rewrite planner           |
//! | `apply` | Rewrite executor          |
//! | `table` | Move table loader         |
//! | `check` | Link pre-check            |
//! | `nav`   | Navigation auditor        |
//! | `cli`   | Command driver            |
//!
//! Filters use `module=level` pairs, `*` naming the default:
//! `--log-filter=plan=trace,*=warn`.

#ifndef DOCLINK_LOG_HPP
#define DOCLINK_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace doclink::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Every link the scanner sees
    Debug = 1, ///< Planner decisions, skipped table entries
    Info = 2,  ///< Per-phase summaries
    Warn = 3,  ///< Default threshold
    Error = 4,
    Fatal = 5,
    Off = 6
};

inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Accepts lower or upper case names; anything else maps to Info.
inline LogLevel parse_level(std::string_view s) {
    static constexpr std::pair<std::string_view, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"error", LogLevel::Error}, {"fatal", LogLevel::Fatal},
        {"off", LogLevel::Off},
    };
    for (const auto& [name, level] : names) {
        if (s == name || s == level_name(level))
            return level;
    }
    return LogLevel::Info;
}

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< One of the tags above
    std::string message;
    const char* file; ///< __FILE__ of the call site
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the Unix epoch
};

enum class LogFormat { Text, JSON };

/// "HH:MM:SS.mmm INFO  [scan] message"
std::string format_text(const LogRecord& record);

/// {"ts":...,"level":"INFO","module":"scan","msg":"..."}
std::string format_json(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// stderr; colors only when stderr is a terminal and TERM is not "dumb".
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends to `--log-file`; Error and Fatal records are flushed at once.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds with a default for untagged modules.
///
/// `parse("plan=debug,scan")` sets `plan` to Debug and `scan` to Trace;
/// `*=level` replaces the default.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold across the default and every module override.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< `--log-filter` or a DOCLINK_LOG filter
    std::string log_file;    ///< Empty for console only
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Until `init()` runs it writes Warn and above to
/// stderr.
class Logger {
public:
    /// Replaces the sinks and thresholds of the global instance.
    static void init(const LogConfig& config);

    static Logger& instance();

    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time
// ============================================================================

/// Local wall-clock time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Command Line
// ============================================================================

/// Builds a LogConfig from argv. Options may appear anywhere on the command
/// line; DOCLINK_LOG is consulted only when none of them sets a level or
/// filter.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for every option `parse_log_options` consumes, so command parsers
/// can skip them.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// Records below this level compile away (0=Trace ... 6=Off).
#ifndef DOCLINK_MIN_LOG_LEVEL
#define DOCLINK_MIN_LOG_LEVEL 0
#endif

#define DOCLINK_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= DOCLINK_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::doclink::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define DOCLINK_LOG_TRACE(module, msg) DOCLINK_LOG_IMPL(::doclink::log::LogLevel::Trace, module, msg)
#define DOCLINK_LOG_DEBUG(module, msg) DOCLINK_LOG_IMPL(::doclink::log::LogLevel::Debug, module, msg)
#define DOCLINK_LOG_INFO(module, msg) DOCLINK_LOG_IMPL(::doclink::log::LogLevel::Info, module, msg)
#define DOCLINK_LOG_WARN(module, msg) DOCLINK_LOG_IMPL(::doclink::log::LogLevel::Warn, module, msg)
#define DOCLINK_LOG_ERROR(module, msg) DOCLINK_LOG_IMPL(::doclink::log::LogLevel::Error, module, msg)
#define DOCLINK_LOG_FATAL(module, msg) DOCLINK_LOG_IMPL(::doclink::log::LogLevel::Fatal, module, msg)

} // namespace doclink::log

#endif // DOCLINK_LOG_HPP
