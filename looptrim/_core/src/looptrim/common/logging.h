#pragma once

#include <iosfwd>
#include <mutex>
#include <sstream>
#include <string>

namespace looptrim {
namespace common {

/**
 * Leveled console logging.
 *
 * Lines are prefixed with the level tag, matching the CLI output style:
 *   [INFO] Writing alignment to 1abc.ali
 *   [DEBUG] index_mapper loop=1 phase=trim trimmed_start=54 trimmed_end=66
 *
 * Debug and Info go to stdout, Warn and Error to stderr, unless a stream
 * has been installed with set_stream() (tests capture output that way).
 */
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* level_tag(LogLevel level);

class Logger {
public:
    /**
     * Structured event: a component name followed by key=value fields.
     * Nothing is formatted when the level is disabled.
     */
    class Event {
    public:
        Event(Logger& logger, LogLevel level, const std::string& component);

        template <typename T>
        Event& field(const std::string& key, const T& value) {
            if (enabled_) {
                body_ << ' ' << key << '=' << value;
            }
            return *this;
        }

        void emit();

    private:
        Logger& logger_;
        LogLevel level_;
        bool enabled_;
        std::ostringstream body_;
    };

    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const;

    // nullptr restores stdout/stderr
    void set_stream(std::ostream* out);

    void write(LogLevel level, const std::string& message);

    Event event(LogLevel level, const std::string& component) {
        return Event(*this, level, component);
    }

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    std::ostream* stream_ = nullptr;
    std::mutex mutex_;
};

inline void log_debug(const std::string& message) {
    Logger::instance().write(LogLevel::Debug, message);
}

inline void log_info(const std::string& message) {
    Logger::instance().write(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    Logger::instance().write(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    Logger::instance().write(LogLevel::Error, message);
}

}  // namespace common
}  // namespace looptrim
