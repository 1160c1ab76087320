#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace rehash {

enum class StopReason : int {
    None = 0,
    Canceled,
    DeadlineExceeded,
};

const char* ToString(StopReason r);

// Copies share one state, so a token handed to a run can be canceled from
// any thread (or from a signal handler through a linked flag).
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken();
    // Copy only: a moved-from token still shares the state.
    CancelToken(const CancelToken&) = default;
    CancelToken& operator=(const CancelToken&) = default;

    static CancelToken WithDeadline(Clock::time_point deadline);
    static CancelToken WithTimeout(Clock::duration timeout);

    void Cancel();

    // New token that stops whenever this one does. Canceling the child does
    // not reach back to this token or its other copies.
    CancelToken Child() const;

    // The token also reports Canceled once *flag becomes true. The flag must
    // outlive every copy of the token.
    void LinkFlag(const std::atomic_bool* flag);

    // Non-blocking poll. Returns StopReason::None while the token is live.
    StopReason Poll() const;
    bool IsCanceled() const { return Poll() != StopReason::None; }

    // Earliest deadline along the parent chain.
    std::optional<Clock::time_point> Deadline() const;

private:
    struct State {
        std::atomic_bool canceled{false};
        std::atomic<const std::atomic_bool*> linked{nullptr};
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<const State> parent;
    };

    std::shared_ptr<State> state_;
};

} // namespace rehash
