#pragma once

#include <cstdarg>
#include <string>

namespace mdeploy {

enum class LogLevel : int {
    Debug   = 0,
    Info    = 1,
    Step    = 2,
    Success = 3,
    Warn    = 4,
    Error   = 5,
    None    = 6,
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    void SetTimestamps(bool on);
    void SetColor(bool on);

    // Mirrors every emitted line (without colors) into a plain file.
    bool SetMirrorFile(const std::string& path);

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

#define LogDebug(...)   ::mdeploy::Logger::Instance().LogWithSource(::mdeploy::LogLevel::Debug,   __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)    ::mdeploy::Logger::Instance().Log(::mdeploy::LogLevel::Info,    __VA_ARGS__)
#define LogStep(...)    ::mdeploy::Logger::Instance().Log(::mdeploy::LogLevel::Step,    __VA_ARGS__)
#define LogSuccess(...) ::mdeploy::Logger::Instance().Log(::mdeploy::LogLevel::Success, __VA_ARGS__)
#define LogWarn(...)    ::mdeploy::Logger::Instance().Log(::mdeploy::LogLevel::Warn,    __VA_ARGS__)
#define LogError(...)   ::mdeploy::Logger::Instance().Log(::mdeploy::LogLevel::Error,   __VA_ARGS__)

} // namespace mdeploy
