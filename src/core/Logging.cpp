#include "Logging.h"

namespace testsum {

Logger::Logger(std::ostream& out, LoggerConfig cfg)
    : out_(out), level_(cfg.level), color_(cfg.color) {}

std::string Logger::prefix(LogLevel level) const {
    const char* name = "INFO";
    const char* code = "\x1b[36m";
    switch(level) {
        case LogLevel::Error: name = "ERROR"; code = "\x1b[31m"; break;
        case LogLevel::Warn:  name = "WARN";  code = "\x1b[33m"; break;
        case LogLevel::Info:  name = "INFO";  code = "\x1b[36m"; break;
        case LogLevel::Debug: name = "DEBUG"; code = "\x1b[37m"; break;
        case LogLevel::Trace: name = "TRACE"; code = "\x1b[90m"; break;
    }
    if(!color_) return std::string("[") + name + "] ";
    return std::string(code) + "[" + name + "]\x1b[0m ";
}

void Logger::log(LogLevel level, const std::string& msg) {
    if(!enabled(level)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << prefix(level) << msg << '\n';
    out_.flush();
}

LoggerConfig logger_config(bool debug, bool no_color) {
    LoggerConfig cfg;
    cfg.level = debug ? LogLevel::Debug : LogLevel::Info;
    cfg.color = !no_color;
    return cfg;
}

}
