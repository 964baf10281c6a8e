#pragma once

#include <cstdarg>
#include <optional>
#include <string_view>

namespace corpus {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error", "none" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging. Each call emits one line with a single write so
    // lines from concurrent worker processes never interleave.
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::corpus::Logger::Instance().LogWithSource(::corpus::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::corpus::Logger::Instance().LogWithSource(::corpus::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::corpus::Logger::Instance().LogWithSource(::corpus::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::corpus::Logger::Instance().LogWithSource(::corpus::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace corpus
