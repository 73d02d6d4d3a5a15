#include "system/Log.h"

#include <cstdio>
#include <utility>

namespace silverbp::system {

namespace {
constexpr size_t kMaxMessageBytes = 160;
}

const char* logLevelLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(LogSink sink, const char* tag, LogLevel minLevel)
    : sink_(std::move(sink)), tag_(tag ? tag : ""), minLevel_(minLevel) {}

Logger Logger::withTag(const char* tag) const {
    return Logger(sink_, tag, minLevel_);
}

bool Logger::enabled(LogLevel level) const {
    return sink_ && level >= minLevel_;
}

void Logger::write(LogLevel level, const char* fmt, va_list args) const {
    if (!enabled(level)) {
        return;
    }
    char buf[kMaxMessageBytes];
    std::vsnprintf(buf, sizeof(buf), fmt, args);

    LogRecord record;
    record.level = level;
    record.tag = tag_;
    record.message = buf;
    sink_(record);
}

void Logger::debug(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Debug, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Info, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Warn, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) const {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Error, fmt, args);
    va_end(args);
}

}  // namespace silverbp::system
