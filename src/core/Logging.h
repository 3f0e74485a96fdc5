#pragma once
#include <string>
#include <mutex>

namespace secret_hunter {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

// Process-wide logger. All output goes to stderr so it never interleaves with
// the finding stream on stdout.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void log(LogLevel level, const std::string& message);
    void error(const std::string& message) { log(LogLevel::Error, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void trace(const std::string& message) { log(LogLevel::Trace, message); }

    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= static_cast<int>(level()); }

private:
    Logger() = default;
    const char* prefix(LogLevel level) const;

    LogLevel level_ = LogLevel::Info;
    mutable std::mutex mutex_;
};

// Parses "error", "warn", "info", "debug", "trace" (case-insensitive).
bool parse_log_level(const std::string& text, LogLevel& out);

}
