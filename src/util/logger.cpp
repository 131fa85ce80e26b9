#include "util/logger.hpp"
#include "tz/progress_sinks.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace tzupdater {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
ILogSink* g_sink = nullptr;

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
    return slash ? (slash + 1) : file;
}

std::string FormatMessage(const char* fmt, va_list ap) {
    va_list copy;
    va_copy(copy, ap);
    const int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n <= 0) return {};

    std::string out(static_cast<size_t>(n) + 1, '\0');
    std::vsnprintf(out.data(), out.size(), fmt, ap);
    out.resize(static_cast<size_t>(n));
    return out;
}
} // namespace

bool ParseLogLevel(const std::string& s, LogLevel& out) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "debug") { out = LogLevel::Debug; return true; }
    if (lower == "info")  { out = LogLevel::Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
    if (lower == "error") { out = LogLevel::Error; return true; }
    if (lower == "none")  { out = LogLevel::None;  return true; }
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

void Logger::SetSink(ILogSink* sink) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_sink = sink;
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
    if (lvl == LogLevel::None) return;

    std::string text;
    ILogSink* sink = nullptr;
    {
        std::lock_guard<std::mutex> lk(g_mu);
        if (lvl < g_level) return;

        text = FormatMessage(fmt, ap);

        if (IsProgressLineActive()) {
            ClearProgressLine();
        }
        char ts[32]{};
        FormatTimestamp(ts, sizeof(ts));
        if (ts[0] != '\0') {
            std::fprintf(stderr, "[%s] [%s] ", ts, ToStr(lvl));
        } else {
            std::fprintf(stderr, "[%s] ", ToStr(lvl));
        }
        const char* base = BaseName(file);
        if (base && line > 0) {
            std::fprintf(stderr, "[%s:%d] ", base, line);
        }
        std::fprintf(stderr, "%s\n", text.c_str());
        sink = g_sink;
    }

    // Sinks run unlocked and may log themselves.
    if (sink) {
        sink->OnLogLine(lvl, text);
    }
}

} // namespace tzupdater
