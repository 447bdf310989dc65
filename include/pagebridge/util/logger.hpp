#pragma once

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace pagebridge {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts DEBUG/INFO/WARN/WARNING/ERROR/OFF/NONE in any case.
std::optional<LogLevel> ParseLogLevel(std::string_view s);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Page HTML and command JSON bodies are logged under their own level so
    // they can be silenced without losing operational lines.
    void SetContentLevel(LogLevel lvl);
    LogLevel ContentLevel() const;

    // Lines are mirrored to this file when set. Empty path closes the sink.
    bool SetLogFile(const std::string& path);

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

    void LogContent(LogLevel lvl,
                    const char* file,
                    int line,
                    const char* label,
                    std::string_view content);

private:
    Logger() = default;
};

// Keeps the first and last four characters of a secret.
std::string MaskSecret(std::string_view value);

#define LogDebug(...) ::pagebridge::Logger::Instance().LogWithSource(::pagebridge::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::pagebridge::Logger::Instance().LogWithSource(::pagebridge::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::pagebridge::Logger::Instance().LogWithSource(::pagebridge::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::pagebridge::Logger::Instance().LogWithSource(::pagebridge::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)
#define LogContentDebug(label, content) ::pagebridge::Logger::Instance().LogContent(::pagebridge::LogLevel::Debug, __FILE__, __LINE__, label, content)

} // namespace pagebridge
