#pragma once

#include "crypto/accumulator_set.hpp"
#include "engine/cancel_token.hpp"
#include "engine/event_channel.hpp"
#include "engine/events.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>

namespace rehash {

inline constexpr std::size_t kMinBufferSize = 512;
inline constexpr std::size_t kMaxBufferSize = 64 * 1024 * 1024;
inline constexpr std::size_t kDefaultBufferSize = 32 * 1024;
inline constexpr std::chrono::milliseconds kDefaultProgressInterval{500};

// Out-of-range sizes are clamped, not rejected. Zero or negative selects the
// default.
std::size_t ClampBufferSize(std::int64_t requested);

struct EngineOptions {
    std::int64_t buffer_size = kDefaultBufferSize;
    // Minimum gap between Progress events. Zero disables them.
    std::chrono::milliseconds progress_interval{0};
    // Advisory, for percentages only. Falls back to the source's TotalSize().
    std::optional<std::uint64_t> total_size;
    bool close_source = true;
};

// Consumer end of one engine run. Next() blocks until the next event and
// returns std::nullopt after the terminal event has been delivered.
// Destroying the stream early cancels the run and waits for the worker.
// The run polls a child of the caller's token: canceling the caller's token
// stops it, but Cancel() and early destruction stop this run only.
class EventStream {
public:
    EventStream() = default;
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;
    EventStream(EventStream&& other) noexcept = default;
    EventStream& operator=(EventStream&& other) noexcept;
    ~EventStream();

    std::optional<Event> Next();

    // No-op on a moved-from stream.
    void Cancel();

private:
    friend class HashEngine;

    void Shutdown();

    std::shared_ptr<EventChannel<Event>> channel_;
    CancelToken cancel_;
    std::thread worker_;
};

// Reads `source` chunk by chunk on a worker thread and feeds every chunk to
// `set`. Exactly one of OK, Stop or Error ends the run; Progress events may
// come before it. The set is sealed when the run ends.
class HashEngine {
public:
    static Result Start(std::unique_ptr<IReader> source,
                        AccumulatorSet set,
                        const EngineOptions& opt,
                        CancelToken cancel,
                        EventStream& out);
};

} // namespace rehash
