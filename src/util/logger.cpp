#include "util/logger.hpp"

#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace mdeploy {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
bool g_timestamps = false;
bool g_color = false;
std::FILE* g_mirror = nullptr;

const char* ToStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Step:    return "STEP";
        case LogLevel::Success: return "OK";
        case LogLevel::Warn:    return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "LOG";
    }
}

const char* ColorOf(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:   return "\033[0;36m";
        case LogLevel::Info:    return "\033[0;34m";
        case LogLevel::Step:    return "\033[0;35m";
        case LogLevel::Success: return "\033[0;32m";
        case LogLevel::Warn:    return "\033[1;33m";
        case LogLevel::Error:   return "\033[0;31m";
        default:                return "";
    }
}

constexpr const char* kReset = "\033[0m";
constexpr const char* kBold = "\033[1m";

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
    return slash ? (slash + 1) : file;
}

void EmitLine(std::FILE* out, LogLevel lvl, bool color, const char* ts,
              const char* base, int line, const char* text) {
    if (lvl == LogLevel::Step) {
        if (color) {
            std::fprintf(out, "\n%s▶%s %s%s%s\n", ColorOf(lvl), kReset, kBold, text, kReset);
        } else {
            std::fprintf(out, "\n▶ %s\n", text);
        }
        return;
    }
    if (ts && ts[0] != '\0') {
        std::fprintf(out, "[%s] ", ts);
    }
    if (color) {
        std::fprintf(out, "%s[%s]%s ", ColorOf(lvl), ToStr(lvl), kReset);
    } else {
        std::fprintf(out, "[%s] ", ToStr(lvl));
    }
    if (base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
    std::fprintf(out, "%s\n", text);
}
} // namespace

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

void Logger::SetTimestamps(bool on) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_timestamps = on;
}

void Logger::SetColor(bool on) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_color = on;
}

bool Logger::SetMirrorFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_mirror) {
        std::fclose(g_mirror);
        g_mirror = nullptr;
    }
    if (path.empty()) return true;
    g_mirror = std::fopen(path.c_str(), "a");
    return g_mirror != nullptr;
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

    char text[4096];
    std::vsnprintf(text, sizeof(text), fmt, ap);

    char ts[32]{};
    if (g_timestamps) {
        FormatTimestamp(ts, sizeof(ts));
    }
    const char* base = BaseName(file);

    EmitLine(stderr, lvl, g_color, ts, base, line, text);
    if (g_mirror) {
        char mirror_ts[32]{};
        FormatTimestamp(mirror_ts, sizeof(mirror_ts));
        EmitLine(g_mirror, lvl, false, mirror_ts, base, line, text);
        std::fflush(g_mirror);
    }
}

} // namespace mdeploy
