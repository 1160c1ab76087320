#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace rehash {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// Accepts "debug", "info", "warn", "error" and "none" in any case.
std::optional<LogLevel> ParseLogLevel(std::string_view name);

const char* ToString(LogLevel lvl);

// Process-wide logger writing one line per message:
//   <time.ms> <LEVEL> [thread] file:line: message
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;
    bool Enabled(LogLevel lvl) const { return lvl != LogLevel::None && lvl >= Level(); }

    // Defaults to stderr. The stream is not owned.
    void SetStream(std::FILE* out);

    // Tag shown for messages logged from the calling thread.
    static void SetThreadName(const char* name);

    void Write(LogLevel lvl, const char* file, int line, const char* fmt, ...)
        __attribute__((format(printf, 5, 6)));
    void VWrite(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap);

    // Redraws the self-overwriting progress line. The next log message or
    // EndProgressLine() terminates it first.
    void WriteProgressLine(const char* text);
    void EndProgressLine();

private:
    Logger() = default;

    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    std::FILE* out_ = nullptr;
    bool progress_active_ = false;
};

#define LogDebug(...) ::rehash::Logger::Instance().Write(::rehash::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::rehash::Logger::Instance().Write(::rehash::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::rehash::Logger::Instance().Write(::rehash::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::rehash::Logger::Instance().Write(::rehash::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace rehash
