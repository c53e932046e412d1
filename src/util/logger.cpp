#include "util/logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace deployer {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
std::FILE* g_file = nullptr;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "LOG";
    }
}

void FormatTimestamp(char* buf, size_t buf_len) {
    if (buf_len == 0) return;
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    std::strftime(buf, buf_len, "%Y-%m-%d %H:%M:%S", &tm);
}

const char* BaseName(const char* file) {
    if (!file || *file == '\0') return nullptr;
    const char* slash = std::strrchr(file, '/');
    const char* backslash = std::strrchr(file, '\\');
    const char* base = slash;
    if (!base || (backslash && backslash > base)) {
        base = backslash;
    }
    return base ? (base + 1) : file;
}

void WriteLine(std::FILE* out, const char* ts, LogLevel lvl, const char* base, int line,
               const char* fmt, va_list ap) {
    if (ts[0] != '\0') {
        std::fprintf(out, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(out, "[%s] ", ToStr(lvl));
    }
    if (base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
    std::vfprintf(out, fmt, ap);
    std::fprintf(out, "\n");
}
} // namespace

bool ParseLogLevel(std::string_view s, LogLevel& out) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info") { out = LogLevel::Info; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    if (lower == "none") { out = LogLevel::None; return true; }
    return false;
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_level = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_level;
}

Result Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    if (path.empty())
        return Result::Ok();

    g_file = std::fopen(path.c_str(), "a");
    if (!g_file) {
        const int err = errno;
        return Result::Fail(err, "cannot open log file " + path + ": " + std::strerror(err));
    }
    return Result::Ok();
}

void Logger::Log(LogLevel lvl, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
    va_end(ap);
}

void Logger::VLog(LogLevel lvl, const char* fmt, va_list ap) {
    VLogWithSource(lvl, nullptr, 0, fmt, ap);
}

void Logger::LogWithSource(LogLevel lvl,
                           const char* file,
                           int line,
                           const char* fmt,
                           ...) {
    va_list ap;
    va_start(ap, fmt);
    VLogWithSource(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VLogWithSource(LogLevel lvl,
                            const char* file,
                            int line,
                            const char* fmt,
                            va_list ap) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl < g_level) return;

    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    const char* base = BaseName(file);

    // A va_list can only be walked once.
    va_list file_ap;
    va_copy(file_ap, ap);
    WriteLine(stderr, ts, lvl, base, line, fmt, ap);
    if (g_file) {
        WriteLine(g_file, ts, lvl, base, line, fmt, file_ap);
        std::fflush(g_file);
    }
    va_end(file_ap);
}

void NoteWithSource(std::vector<Diagnostic>& out,
                    Severity severity,
                    const char* file,
                    int line,
                    std::string message) {
    LogLevel lvl = LogLevel::Info;
    switch (severity) {
        case Severity::Info:  lvl = LogLevel::Info; break;
        case Severity::Warn:  lvl = LogLevel::Warn; break;
        case Severity::Error: lvl = LogLevel::Error; break;
    }
    Logger::Instance().LogWithSource(lvl, file, line, "%s", message.c_str());
    out.push_back(Diagnostic{.severity = severity, .message = std::move(message)});
}

} // namespace deployer
