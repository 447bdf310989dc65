#include "pagebridge/util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace pagebridge {

namespace {
std::mutex g_mu;
LogLevel g_level = LogLevel::Info;
LogLevel g_content_level = LogLevel::Debug;
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

// Caller holds g_mu.
void WritePrefix(std::FILE* out, LogLevel lvl, const char* file, int line) {
    char ts[32]{};
    FormatTimestamp(ts, sizeof(ts));
    if (ts[0] != '\0') {
        std::fprintf(out, "[%s] [%s] ", ts, ToStr(lvl));
    } else {
        std::fprintf(out, "[%s] ", ToStr(lvl));
    }
    const char* base = BaseName(file);
    if (base && line > 0) {
        std::fprintf(out, "[%s:%d] ", base, line);
    }
}
} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view s) {
    std::string up(s);
    std::transform(up.begin(), up.end(), up.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (up == "DEBUG") return LogLevel::Debug;
    if (up == "INFO") return LogLevel::Info;
    if (up == "WARN" || up == "WARNING") return LogLevel::Warn;
    if (up == "ERROR") return LogLevel::Error;
    if (up == "OFF" || up == "NONE") return LogLevel::None;
    return std::nullopt;
}

std::string MaskSecret(std::string_view value) {
    if (value.empty()) return "<empty>";
    if (value.size() <= 8) return std::string(value.size(), '*');
    std::string out(value.substr(0, 4));
    out += "...";
    out += value.substr(value.size() - 4);
    return out;
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

void Logger::SetContentLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_content_level = lvl;
}

LogLevel Logger::ContentLevel() const {
    std::lock_guard<std::mutex> lk(g_mu);
    return g_content_level;
}

bool Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    if (path.empty()) return true;
    g_file = std::fopen(path.c_str(), "a");
    return g_file != nullptr;
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

    va_list file_ap;
    va_copy(file_ap, ap);

    WritePrefix(stderr, lvl, file, line);
    std::vfprintf(stderr, fmt, ap);
    std::fprintf(stderr, "\n");

    if (g_file) {
        WritePrefix(g_file, lvl, file, line);
        std::vfprintf(g_file, fmt, file_ap);
        std::fprintf(g_file, "\n");
        std::fflush(g_file);
    }
    va_end(file_ap);
}

void Logger::LogContent(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* label,
                        std::string_view content) {
    {
        std::lock_guard<std::mutex> lk(g_mu);
        if (g_content_level == LogLevel::None || lvl < g_content_level) return;
    }
    LogWithSource(lvl, file, line, "%s (%zu bytes): %.*s",
                  label, content.size(), static_cast<int>(content.size()), content.data());
}

} // namespace pagebridge
