#include "util/progress_sinks.hpp"

#include "util/logger.hpp"

#include <cstdio>

namespace rehash {

namespace {
double MiB(std::uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    char line[256];
    if (e.total > 0) {
        std::snprintf(line,
                      sizeof(line),
                      "[%s] %6.2f%% (%.1f/%.1f MiB)",
                      label_.c_str(),
                      static_cast<double>(e.percent),
                      MiB(e.offset),
                      MiB(e.total));
    } else {
        std::snprintf(line, sizeof(line), "[%s] %.1f MiB", label_.c_str(), MiB(e.offset));
    }
    Logger::Instance().WriteProgressLine(line);
}

void ConsoleProgressSink::Finish() { Logger::Instance().EndProgressLine(); }

} // namespace rehash
