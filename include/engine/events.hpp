#pragma once

#include "crypto/accumulator.hpp"
#include "crypto/accumulator_set.hpp"
#include "engine/cancel_token.hpp"
#include "util/result.hpp"

#include <chrono>
#include <cstdint>
#include <variant>

namespace rehash {

using EventClock = std::chrono::system_clock;

struct ProgressEvent {
    EventClock::time_point when = EventClock::now();
    std::uint64_t total = 0;      // advisory, 0 when unknown
    std::uint64_t processed = 0;  // bytes written to the set by this run
    std::uint64_t offset = 0;     // base offset + processed
    float percent = 0.0f;
};

struct StopEvent {
    EventClock::time_point when = EventClock::now();
    std::uint64_t processed = 0;
    std::uint64_t offset = 0;
    StateMap states;
    StopReason reason = StopReason::Canceled;

    // What a caller has to keep to continue later.
    SavedSession Session() const { return SavedSession{.computed = offset, .states = states}; }
};

struct ErrorEvent {
    EventClock::time_point when = EventClock::now();
    Result error;
};

struct OkEvent {
    EventClock::time_point when = EventClock::now();
    std::uint64_t processed = 0;
    std::uint64_t offset = 0;
    DigestMap digests;
};

using Event = std::variant<ProgressEvent, StopEvent, ErrorEvent, OkEvent>;

inline bool IsTerminal(const Event& ev) {
    return !std::holds_alternative<ProgressEvent>(ev);
}

inline EventClock::time_point When(const Event& ev) {
    return std::visit([](const auto& e) { return e.when; }, ev);
}

// 0 when total is unknown. Capped at 100.
float Percent(std::uint64_t done, std::uint64_t total);

} // namespace rehash
