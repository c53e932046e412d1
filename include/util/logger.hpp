#pragma once

#include "util/result.hpp"

#include <cstdarg>
#include <string>
#include <string_view>
#include <vector>

namespace deployer {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn"/"warning", "error", "none" (any case).
bool ParseLogLevel(std::string_view s, LogLevel& out);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Mirror every line to an append-mode file. Empty path closes it.
    Result SetLogFile(const std::string& path);

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

#define LogDebug(...) ::deployer::Logger::Instance().LogWithSource(::deployer::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::deployer::Logger::Instance().LogWithSource(::deployer::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::deployer::Logger::Instance().LogWithSource(::deployer::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::deployer::Logger::Instance().LogWithSource(::deployer::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

// Logs the message at the matching level and records it in `out`.
void NoteWithSource(std::vector<Diagnostic>& out,
                    Severity severity,
                    const char* file,
                    int line,
                    std::string message);

#define Note(out, severity, ...) ::deployer::NoteWithSource((out), (severity), __FILE__, __LINE__, __VA_ARGS__)

} // namespace deployer
