#define _FILE_OFFSET_BITS 64

#include "crypto/accumulator_set.hpp"
#include "crypto/digest_registry.hpp"
#include "engine/cancel_token.hpp"
#include "engine/checksums.hpp"
#include "engine/hash_engine.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/progress_sinks.hpp"
#include "util/session_store.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unistd.h>
#include <variant>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/rehash/rehash.conf";

enum ExitCode : int {
    kExitOk = 0,
    kExitError = 1,
    kExitUsage = 2,
    kExitStopped = 3,
    kExitNoMatch = 4,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <input|->\n"
        "\n"
        "Options:\n"
        "  -a, --alg <list>         Comma separated algorithms (default: all)\n"
        "  -b, --buffer-size <n>    Read buffer size in bytes\n"
        "  -t, --timeout <ms>       Stop after <ms> milliseconds and save the session\n"
        "  -r, --resume <file>      Resume from a saved session\n"
        "  -s, --save <file>        Where to save the session when stopped\n"
        "                           (default: <input>.rehash.json)\n"
        "  -m, --match <hex>        Report which algorithm matches the checksum\n"
        "  -c, --config <file>      Config file (default %s)\n"
        "  -p, --progress           Show progress on stderr\n"
        "  -l, --list               List supported algorithms\n"
        "  -v, --verbose            Debug logging\n"
        "  -h, --help               Show this help\n",
        argv,
        kDefaultConfigPath);
}

std::vector<std::string> SplitList(const std::string &s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t end = s.find(',', start);
        if (end == std::string::npos) end = s.size();
        if (end > start) out.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

// A missing default config file is fine, an explicitly named one is not.
rehash::Result LoadConfig(const std::string &path, bool required, rehash::config::RehashConfigFromFile &cfg) {
    if (!required && ::access(path.c_str(), F_OK) != 0) {
        return rehash::Result::Ok();
    }
    std::string err;
    if (!cfg.LoadFile(path, err)) {
        return rehash::Result::Fail(rehash::Errc::ConfigError, err);
    }
    return rehash::Result::Ok();
}

bool ParseNumber(const char *arg, long long &out) {
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(arg, &end, 10);
    if (errno != 0 || !end || end == arg || *end != '\0') return false;
    out = v;
    return true;
}

} // namespace

int main(int argc, char **argv) {
    if (!rehash::InstallSignalHandlers()) {
        LogWarn("cannot install signal handlers: %s", std::strerror(errno));
    }

    std::vector<std::string> algs_cli;
    std::optional<long long> buffer_cli;
    std::optional<long long> timeout_ms;
    std::string resume_path;
    std::string save_path;
    std::string match;
    std::string config_path = kDefaultConfigPath;
    bool config_explicit = false;
    bool progress_cli = false;
    bool verbose = false;

    static option long_opts[] = {
        {"alg", required_argument, nullptr, 'a'},
        {"buffer-size", required_argument, nullptr, 'b'},
        {"timeout", required_argument, nullptr, 't'},
        {"resume", required_argument, nullptr, 'r'},
        {"save", required_argument, nullptr, 's'},
        {"match", required_argument, nullptr, 'm'},
        {"config", required_argument, nullptr, 'c'},
        {"progress", no_argument, nullptr, 'p'},
        {"list", no_argument, nullptr, 'l'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "a:b:t:r:s:m:c:plvh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'l':
                for (const auto &alg : rehash::SupportedAlgorithms()) {
                    std::printf("%s\n", alg.c_str());
                }
                return kExitOk;

            case 'a':
                algs_cli = SplitList(optarg);
                break;

            case 'b': {
                long long v = 0;
                if (!ParseNumber(optarg, v)) {
                    std::fprintf(stderr, "Invalid --buffer-size: %s\n", optarg);
                    return kExitUsage;
                }
                buffer_cli = v;
                break;
            }

            case 't': {
                long long v = 0;
                if (!ParseNumber(optarg, v) || v <= 0) {
                    std::fprintf(stderr, "Invalid --timeout: %s\n", optarg);
                    return kExitUsage;
                }
                timeout_ms = v;
                break;
            }

            case 'r':
                resume_path = optarg;
                break;

            case 's':
                save_path = optarg;
                break;

            case 'm':
                match = optarg;
                break;

            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'p':
                progress_cli = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string input = argv[optind];

    rehash::config::RehashConfigFromFile cfg;
    if (auto r = LoadConfig(config_path, config_explicit, cfg); !r.ok) {
        LogError("%s: %s", rehash::ToString(r.err), r.msg.c_str());
        return kExitError;
    }

    if (cfg.log_level) {
        rehash::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (verbose) {
        rehash::Logger::Instance().SetLevel(rehash::LogLevel::Debug);
    }

    std::vector<std::string> algs = cfg.SelectAlgorithms(algs_cli, !resume_path.empty());

    rehash::AccumulatorSet set;
    std::uint64_t offset = 0;
    if (!resume_path.empty()) {
        rehash::SavedSession session;
        if (auto r = rehash::LoadSession(resume_path, session); !r.ok) {
            LogError("%s", r.msg.c_str());
            return kExitError;
        }
        if (auto r = rehash::AccumulatorSet::Restore(session, algs, set); !r.ok) {
            LogError("cannot resume: %s", r.msg.c_str());
            return kExitError;
        }
        offset = session.computed;
        LogInfo("resuming %s at offset %llu", input.c_str(), static_cast<unsigned long long>(offset));
    } else {
        if (algs.empty()) {
            algs = rehash::SupportedAlgorithms();
        }
        if (auto r = rehash::AccumulatorSet::Create(algs, set); !r.ok) {
            LogError("%s", r.msg.c_str());
            return kExitError;
        }
    }

    // Standard input cannot seek: the caller pipes in the remaining bytes.
    if (input == "-" && offset != 0) {
        LogInfo("reading the bytes after offset %llu from standard input",
                static_cast<unsigned long long>(offset));
        offset = 0;
    }

    auto reader = std::make_unique<rehash::FileOrStdinReader>();
    if (auto r = rehash::FileOrStdinReader::Open(input, offset, *reader); !r.ok) {
        LogError("%s", r.msg.c_str());
        return kExitError;
    }

    if (save_path.empty()) {
        save_path = (input == "-") ? "rehash-session.json" : input + ".rehash.json";
    }

    rehash::EngineOptions opt;
    if (cfg.buffer_size) opt.buffer_size = *cfg.buffer_size;
    if (buffer_cli) opt.buffer_size = *buffer_cli;
    const bool show_progress = progress_cli || cfg.progress.value_or(false);
    if (show_progress) {
        opt.progress_interval = cfg.progress_interval_ms
                                    ? std::chrono::milliseconds(*cfg.progress_interval_ms)
                                    : rehash::kDefaultProgressInterval;
    }

    rehash::CancelToken cancel = timeout_ms
                                     ? rehash::CancelToken::WithTimeout(std::chrono::milliseconds(*timeout_ms))
                                     : rehash::CancelToken();
    cancel.LinkFlag(&rehash::g_cancel);

    rehash::EventStream stream;
    if (auto r = rehash::HashEngine::Start(std::move(reader), std::move(set), opt, cancel, stream); !r.ok) {
        LogError("%s", r.msg.c_str());
        return kExitError;
    }

    rehash::ConsoleProgressSink progress(input);
    int rc = kExitError;

    while (auto ev = stream.Next()) {
        std::visit(
            [&](auto &e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, rehash::ProgressEvent>) {
                    progress.OnProgress(e);
                } else if constexpr (std::is_same_v<T, rehash::OkEvent>) {
                    progress.Finish();
                    for (const auto &[alg, hex] : rehash::ChecksumStrings(e.digests)) {
                        std::printf("%-8s %s  %s\n", alg.c_str(), hex.c_str(), input.c_str());
                    }
                    LogDebug("hashed %llu bytes",
                             static_cast<unsigned long long>(e.offset));
                    rc = kExitOk;
                    if (!match.empty()) {
                        if (auto alg = rehash::Match(e.digests, match)) {
                            std::printf("matched: %s\n", alg->c_str());
                        } else {
                            std::printf("no match\n");
                            rc = kExitNoMatch;
                        }
                    }
                } else if constexpr (std::is_same_v<T, rehash::StopEvent>) {
                    progress.Finish();
                    if (auto r = rehash::SaveSession(save_path, e.Session()); !r.ok) {
                        LogError("stopped at %llu but cannot save session: %s",
                                 static_cast<unsigned long long>(e.offset),
                                 r.msg.c_str());
                        rc = kExitError;
                        return;
                    }
                    LogInfo("stopped (%s) at %llu bytes, session saved to %s",
                            rehash::ToString(e.reason),
                            static_cast<unsigned long long>(e.offset),
                            save_path.c_str());
                    rc = kExitStopped;
                } else if constexpr (std::is_same_v<T, rehash::ErrorEvent>) {
                    progress.Finish();
                    LogError("hash run failed (%s): %s", rehash::ToString(e.error.err), e.error.msg.c_str());
                    rc = kExitError;
                }
            },
            *ev);
    }

    return rc;
}
