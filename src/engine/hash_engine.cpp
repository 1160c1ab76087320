#include "engine/hash_engine.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace rehash {

namespace {

std::string JoinAlgorithms(const AccumulatorSet& set) {
    std::string out;
    for (const auto& alg : set.Algorithms()) {
        if (!out.empty()) out += ",";
        out += alg;
    }
    return out;
}

class Run {
public:
    Run(std::unique_ptr<IReader> source,
        AccumulatorSet set,
        const EngineOptions& opt,
        CancelToken cancel,
        std::shared_ptr<EventChannel<Event>> channel)
        : source_(std::move(source)),
          set_(std::move(set)),
          opt_(opt),
          cancel_(std::move(cancel)),
          channel_(std::move(channel)) {}

    void operator()() {
        Logger::SetThreadName("hash");
        std::optional<Event> terminal;
        try {
            terminal = Loop();
        } catch (const std::exception& e) {
            LogError("hash run aborted after %llu bytes: %s",
                     static_cast<unsigned long long>(set_.Offset()),
                     e.what());
            terminal = ErrorEvent{.error = Result::Fail(Errc::InternalError, e.what())};
        }

        set_.Seal();
        if (opt_.close_source) {
            source_->Close();
        }
        if (terminal) {
            (void)channel_->Send(std::move(*terminal));
        }
        channel_->Close();
    }

private:
    // Returns the terminal event, or std::nullopt when the consumer went away.
    std::optional<Event> Loop() {
        const std::size_t buf_size = ClampBufferSize(opt_.buffer_size);
        std::vector<std::uint8_t> buf(buf_size);

        const std::uint64_t total = opt_.total_size.value_or(source_->TotalSize().value_or(0));
        const bool report = opt_.progress_interval.count() > 0;
        auto last_report = std::chrono::steady_clock::now();

        LogDebug("hash run started: algs=%s buffer=%zu offset=%llu total=%llu",
                 JoinAlgorithms(set_).c_str(),
                 buf_size,
                 static_cast<unsigned long long>(set_.BaseOffset()),
                 static_cast<unsigned long long>(total));

        while (true) {
            const StopReason reason = cancel_.Poll();
            if (reason != StopReason::None) {
                return OnStop(reason);
            }

            errno = 0;
            const ssize_t n = source_->Read(std::span<std::uint8_t>(buf.data(), buf.size()));
            if (n < 0) {
                const int e = errno;
                std::string msg = "read failed after " + std::to_string(set_.Offset()) + " bytes";
                if (e != 0) {
                    msg += " (" + std::string(std::strerror(e)) + ")";
                }
                LogError("%s", msg.c_str());
                return ErrorEvent{.error = Result::Fail(Errc::SourceReadError, std::move(msg))};
            }
            if (n == 0) {
                LogDebug("hash run completed: %llu bytes",
                         static_cast<unsigned long long>(set_.BytesWritten()));
                return OkEvent{.processed = set_.BytesWritten(),
                               .offset = set_.Offset(),
                               .digests = set_.Digests()};
            }

            auto wr = set_.Write(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
            if (!wr.ok) {
                LogError("%s", wr.msg.c_str());
                return ErrorEvent{.error = std::move(wr)};
            }

            if (report) {
                const auto now = std::chrono::steady_clock::now();
                if (now - last_report >= opt_.progress_interval) {
                    last_report = now;
                    ProgressEvent ev{.total = total,
                                     .processed = set_.BytesWritten(),
                                     .offset = set_.Offset(),
                                     .percent = Percent(set_.Offset(), total)};
                    if (!channel_->Send(ev)) {
                        LogDebug("event consumer went away, ending run");
                        return std::nullopt;
                    }
                }
            }
        }
    }

    Event OnStop(StopReason reason) {
        StateMap states;
        auto r = set_.ExportState(states);
        if (!r.ok) {
            LogError("cannot save state on stop: %s", r.msg.c_str());
            return ErrorEvent{.error = std::move(r)};
        }
        LogInfo("hash run stopped (%s) after %llu bytes, offset %llu",
                ToString(reason),
                static_cast<unsigned long long>(set_.BytesWritten()),
                static_cast<unsigned long long>(set_.Offset()));
        return StopEvent{.processed = set_.BytesWritten(),
                         .offset = set_.Offset(),
                         .states = std::move(states),
                         .reason = reason};
    }

    std::unique_ptr<IReader> source_;
    AccumulatorSet set_;
    EngineOptions opt_;
    CancelToken cancel_;
    std::shared_ptr<EventChannel<Event>> channel_;
};

} // namespace

std::size_t ClampBufferSize(std::int64_t requested) {
    if (requested <= 0) return kDefaultBufferSize;
    const auto size = static_cast<std::uint64_t>(requested);
    return static_cast<std::size_t>(std::clamp<std::uint64_t>(size, kMinBufferSize, kMaxBufferSize));
}

EventStream& EventStream::operator=(EventStream&& other) noexcept {
    if (this != &other) {
        Shutdown();
        channel_ = std::move(other.channel_);
        cancel_ = std::move(other.cancel_);
        worker_ = std::move(other.worker_);
    }
    return *this;
}

EventStream::~EventStream() { Shutdown(); }

std::optional<Event> EventStream::Next() {
    if (!channel_) return std::nullopt;
    return channel_->Receive();
}

void EventStream::Cancel() {
    if (channel_) {
        cancel_.Cancel();
    }
}

void EventStream::Shutdown() {
    if (!worker_.joinable()) return;
    if (!channel_->Closed()) {
        cancel_.Cancel();
    }
    channel_->Abandon();
    worker_.join();
}

Result HashEngine::Start(std::unique_ptr<IReader> source,
                         AccumulatorSet set,
                         const EngineOptions& opt,
                         CancelToken cancel,
                         EventStream& out) {
    if (!source) {
        return Result::Fail(Errc::SourceOpenFailed, "no source to read from");
    }
    if (set.Empty()) {
        return Result::Fail(Errc::NoAlgorithmSpecified, "no hash algorithm specified");
    }
    if (set.Sealed()) {
        return Result::Fail(Errc::ConsumerProtocolViolation, "accumulator set already terminated");
    }

    EventStream stream;
    stream.channel_ = std::make_shared<EventChannel<Event>>();
    stream.cancel_ = cancel.Child();
    stream.worker_ = std::thread(Run(std::move(source), std::move(set), opt, stream.cancel_, stream.channel_));

    out = std::move(stream);
    return Result::Ok();
}

} // namespace rehash
