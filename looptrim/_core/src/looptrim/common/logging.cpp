#include "logging.h"

#include <iostream>

namespace looptrim {
namespace common {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "[DEBUG]";
        case LogLevel::Info:
            return "[INFO]";
        case LogLevel::Warn:
            return "[WARN]";
        case LogLevel::Error:
            return "[ERROR]";
        default:
            return "";
    }
}

Logger::Event::Event(Logger& logger, LogLevel level, const std::string& component)
    : logger_(logger), level_(level), enabled_(logger.enabled(level)) {
    if (enabled_) {
        body_ << component;
    }
}

void Logger::Event::emit() {
    if (enabled_) {
        logger_.write(level_, body_.str());
        enabled_ = false;  // emit at most once
    }
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

bool Logger::enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= level_;
}

void Logger::set_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = out;
}

void Logger::write(LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = stream_ ? *stream_
                                : (level >= LogLevel::Warn ? std::cerr : std::cout);
    out << level_tag(level) << ' ' << message << '\n';
    out.flush();
}

}  // namespace common
}  // namespace looptrim
