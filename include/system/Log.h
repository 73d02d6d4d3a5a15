#pragma once

#include <cstdarg>
#include <functional>
#include <string>

namespace silverbp::system {

enum class LogLevel { Debug, Info, Warn, Error };

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string tag;
    std::string message;
};

using LogSink = std::function<void(const LogRecord&)>;

const char* logLevelLabel(LogLevel level);

/**
 * @brief Tagged printf-style front end for an injected LogSink.
 *
 * Components receive a Logger by value; it never owns global state, so a test
 * can capture records by binding the sink to a vector.
 *
 * @code
 * Logger log(sink, "SESSION");
 * log.warn("timeout after %lu ms", static_cast<unsigned long>(timeoutMs));
 * @endcode
 */
class Logger {
public:
    Logger() = default;
    Logger(LogSink sink, const char* tag, LogLevel minLevel = LogLevel::Debug);

    void debug(const char* fmt, ...) const;
    void info(const char* fmt, ...) const;
    void warn(const char* fmt, ...) const;
    void error(const char* fmt, ...) const;

    Logger withTag(const char* tag) const;
    [[nodiscard]] bool enabled(LogLevel level) const;

private:
    void write(LogLevel level, const char* fmt, va_list args) const;

    LogSink sink_;
    std::string tag_;
    LogLevel minLevel_ = LogLevel::Debug;
};

}  // namespace silverbp::system
