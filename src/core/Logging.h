#pragma once
#include <string>
#include <ostream>
#include <mutex>
#include <atomic>

namespace testsum {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

struct LoggerConfig {
    LogLevel level = LogLevel::Info;
    bool color = true;
};

// Explicitly constructed by main() and passed by reference to every component
// that emits diagnostics. There is no process-wide instance.
class Logger {
public:
    explicit Logger(std::ostream& out, LoggerConfig cfg = {});

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    bool color() const { return color_; }
    bool enabled(LogLevel level) const { return static_cast<int>(level) <= static_cast<int>(level_.load()); }

    void log(LogLevel level, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) { log(LogLevel::Debug, msg); }
    void trace(const std::string& msg) { log(LogLevel::Trace, msg); }

private:
    std::string prefix(LogLevel level) const;

    std::ostream& out_;
    std::atomic<LogLevel> level_;
    bool color_;
    std::mutex mutex_;
};

LoggerConfig logger_config(bool debug, bool no_color);

}
