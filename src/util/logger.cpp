#include "util/logger.hpp"

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <string>

namespace rehash {

namespace {

thread_local const char* t_thread_name = "main";

// "HH:MM:SS.mmm", local time.
void FormatTime(char* buf, size_t len) {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    if (localtime_r(&secs, &tm) == nullptr) {
        buf[0] = '\0';
        return;
    }
    const size_t n = std::strftime(buf, len, "%H:%M:%S", &tm);
    std::snprintf(buf + n, len - n, ".%03d", static_cast<int>(ms));
}

const char* BaseName(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string s(name);
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "none" || s == "off") return LogLevel::None;
    return std::nullopt;
}

const char* ToString(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None:  return "NONE";
    }
    return "LOG";
}

Logger& Logger::Instance() {
    static Logger inst;
    return inst;
}

void Logger::SetLevel(LogLevel lvl) {
    std::lock_guard<std::mutex> lk(mu_);
    level_ = lvl;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lk(mu_);
    return level_;
}

void Logger::SetStream(std::FILE* out) {
    std::lock_guard<std::mutex> lk(mu_);
    out_ = out;
}

void Logger::SetThreadName(const char* name) { t_thread_name = name ? name : "?"; }

void Logger::Write(LogLevel lvl, const char* file, int line, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    VWrite(lvl, file, line, fmt, ap);
    va_end(ap);
}

void Logger::VWrite(LogLevel lvl, const char* file, int line, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> lk(mu_);
    if (lvl == LogLevel::None || lvl < level_) return;

    std::FILE* out = out_ ? out_ : stderr;
    if (progress_active_) {
        std::fputc('\n', out);
        progress_active_ = false;
    }

    char ts[32]{};
    FormatTime(ts, sizeof(ts));
    std::fprintf(out, "%s %-5s [%s] ", ts, ToString(lvl), t_thread_name);
    if (file && line > 0) {
        std::fprintf(out, "%s:%d: ", BaseName(file), line);
    }
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
    std::fflush(out);
}

void Logger::WriteProgressLine(const char* text) {
    std::lock_guard<std::mutex> lk(mu_);
    std::FILE* out = out_ ? out_ : stderr;
    std::fprintf(out, "\r%s", text);
    std::fflush(out);
    progress_active_ = true;
}

void Logger::EndProgressLine() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!progress_active_) return;
    std::FILE* out = out_ ? out_ : stderr;
    std::fputc('\n', out);
    std::fflush(out);
    progress_active_ = false;
}

} // namespace rehash
