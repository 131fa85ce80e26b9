#pragma once

#include <cstdarg>
#include <string>

namespace tzupdater {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

bool ParseLogLevel(const std::string& s, LogLevel& out);

// Receives every message that passes the level filter, already formatted
// but without timestamp or source prefix.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void OnLogLine(LogLevel lvl, const std::string& line) = 0;
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Not owned. Pass nullptr to detach.
    void SetSink(ILogSink* sink);

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
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

#define LogDebug(...) ::tzupdater::Logger::Instance().LogWithSource(::tzupdater::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::tzupdater::Logger::Instance().LogWithSource(::tzupdater::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::tzupdater::Logger::Instance().LogWithSource(::tzupdater::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::tzupdater::Logger::Instance().LogWithSource(::tzupdater::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace tzupdater
