#pragma once

#include <cstdarg>
#include <expected>
#include <string>
#include <string_view>

namespace repack {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (case-insensitive).
std::expected<LogLevel, std::string> ParseLogLevel(std::string_view name);
const char* LogLevelName(LogLevel lvl);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // printf-style logging, one line per call on stderr
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

#define LogDebug(...) ::repack::Logger::Instance().LogWithSource(::repack::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::repack::Logger::Instance().LogWithSource(::repack::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::repack::Logger::Instance().LogWithSource(::repack::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::repack::Logger::Instance().LogWithSource(::repack::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace repack
