#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace rehash {

// Single-producer / single-consumer hand-off with room for one element.
// The producer blocks in Send() until the previous element was received;
// Close() ends the sequence once the last element has been taken.
template <typename T>
class EventChannel {
public:
    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false if the channel is closed or the receiver went away.
    bool Send(T item) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return !slot_.has_value() || abandoned_; });
        if (abandoned_ || closed_)
            return false;
        slot_.emplace(std::move(item));
        cv_.notify_all();
        return true;
    }

    void Close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    // Blocks until an element is available. std::nullopt means the sequence
    // has ended.
    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return slot_.has_value() || closed_ || abandoned_; });
        if (!slot_)
            return std::nullopt;
        std::optional<T> item(std::move(slot_));
        slot_.reset();
        cv_.notify_all();
        return item;
    }

    // Receiver side: drop any pending element and release a blocked sender.
    void Abandon() {
        std::lock_guard<std::mutex> lk(mu_);
        abandoned_ = true;
        slot_.reset();
        cv_.notify_all();
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::optional<T> slot_;
    bool closed_ = false;
    bool abandoned_ = false;
};

} // namespace rehash
