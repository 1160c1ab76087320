#include "engine/cancel_token.hpp"

namespace rehash {

const char* ToString(StopReason r) {
    switch (r) {
        case StopReason::None:             return "none";
        case StopReason::Canceled:         return "canceled";
        case StopReason::DeadlineExceeded: return "deadline exceeded";
    }
    return "unknown";
}

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken CancelToken::WithDeadline(Clock::time_point deadline) {
    CancelToken t;
    t.state_->deadline = deadline;
    return t;
}

CancelToken CancelToken::WithTimeout(Clock::duration timeout) {
    return WithDeadline(Clock::now() + timeout);
}

void CancelToken::Cancel() {
    state_->canceled.store(true, std::memory_order_relaxed);
}

CancelToken CancelToken::Child() const {
    CancelToken t;
    t.state_->parent = state_;
    return t;
}

void CancelToken::LinkFlag(const std::atomic_bool* flag) {
    state_->linked.store(flag, std::memory_order_relaxed);
}

StopReason CancelToken::Poll() const {
    bool expired = false;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->canceled.load(std::memory_order_relaxed)) {
            return StopReason::Canceled;
        }
        const std::atomic_bool* linked = s->linked.load(std::memory_order_relaxed);
        if (linked && linked->load(std::memory_order_relaxed)) {
            return StopReason::Canceled;
        }
        if (s->deadline && Clock::now() >= *s->deadline) {
            expired = true;
        }
    }
    return expired ? StopReason::DeadlineExceeded : StopReason::None;
}

std::optional<CancelToken::Clock::time_point> CancelToken::Deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!earliest || *s->deadline < *earliest)) {
            earliest = s->deadline;
        }
    }
    return earliest;
}

} // namespace rehash
