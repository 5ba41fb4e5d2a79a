#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "cirisstream/core/delivery/drop_policy.hpp"
#include "cirisstream/core/config/client.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::core::delivery {

/*
===============================================================================
 cirisstream::core::delivery::Queue<T>
===============================================================================

Bounded multi-producer / multi-consumer FIFO between the message pump and
the consumer.

Guarantees:
  • push() never blocks. When full, exactly one element is discarded
    according to the DropPolicy
  • size() <= capacity() at all times
  • pop() blocks until an element is available or the queue is closed
  • close() is terminal: blocked consumers wake up and receive false,
    pending elements are discarded, later pushes return Closed

A backpressure warning is logged once each time the size crosses the
high-water mark upward. It re-arms when the size falls below the mark.
===============================================================================
*/

enum class PushResult : std::uint8_t {
    Queued,          // appended, nothing discarded
    DroppedOldest,   // appended after evicting the head
    DroppedNewest,   // incoming element discarded
    Closed           // queue closed, element discarded
};

[[nodiscard]]
inline constexpr std::string_view to_string(PushResult r) noexcept {
    switch (r) {
        case PushResult::Queued:        return "Queued";
        case PushResult::DroppedOldest: return "DroppedOldest";
        case PushResult::DroppedNewest: return "DroppedNewest";
        case PushResult::Closed:        return "Closed";
        default:                        return "Unknown";
    }
}

template <typename T>
class Queue {
public:
    explicit Queue(std::size_t capacity,
                   DropPolicy policy = DropPolicy::Oldest,
                   double warn_ratio = 0.8)
        : capacity_(capacity == 0 ? 1 : capacity)
        , policy_(policy)
    {
        if (warn_ratio <= 0.0 || warn_ratio > 1.0) {
            warn_ratio = 1.0;
        }
        high_water_ = static_cast<std::size_t>(static_cast<double>(capacity_) * warn_ratio);
        if (high_water_ == 0) {
            high_water_ = 1;
        }
    }

    explicit Queue(const config::Backpressure& cfg)
        : Queue(cfg.capacity, cfg.drop_policy, cfg.warn_ratio)
    {
    }

    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    [[nodiscard]]
    PushResult push(T item) {
        PushResult result = PushResult::Queued;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (items_.size() >= capacity_) {
                ++dropped_;
                if (policy_ == DropPolicy::Newest) {
                    CS_DEBUG("[QUEUE] Full (" << capacity_ << "), dropping incoming message");
                    return PushResult::DroppedNewest;
                }
                CS_DEBUG("[QUEUE] Full (" << capacity_ << "), dropping oldest message");
                items_.pop_front();
                result = PushResult::DroppedOldest;
            }
            items_.push_back(std::move(item));
            ++pushed_;
            check_high_water_();
        }
        not_empty_.notify_one();
        return result;
    }

    // Blocks until an element is available (true) or the queue is closed (false)
    [[nodiscard]]
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_(out);
    }

    [[nodiscard]]
    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_(out);
    }

    [[nodiscard]]
    bool pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take_(out);
    }

    // Terminal. Idempotent.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            if (!items_.empty()) {
                CS_DEBUG("[QUEUE] Closed with " << items_.size() << " undelivered message(s)");
            }
            items_.clear();
        }
        not_empty_.notify_all();
    }

    [[nodiscard]]
    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]]
    bool empty() const {
        return size() == 0;
    }

    [[nodiscard]]
    std::size_t capacity() const noexcept {
        return capacity_;
    }

    [[nodiscard]]
    DropPolicy drop_policy() const noexcept {
        return policy_;
    }

    [[nodiscard]]
    std::size_t high_water_mark() const noexcept {
        return high_water_;
    }

    // Counters
    [[nodiscard]]
    std::uint64_t pushed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushed_;
    }

    [[nodiscard]]
    std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    [[nodiscard]]
    std::uint64_t high_water_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return high_water_events_;
    }

private:
    // Requires mutex_ held
    bool take_(T& out) {
        if (closed_ || items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        if (above_high_water_ && items_.size() < high_water_) {
            above_high_water_ = false;
        }
        return true;
    }

    // Requires mutex_ held
    void check_high_water_() {
        if (!above_high_water_ && items_.size() >= high_water_) {
            above_high_water_ = true;
            ++high_water_events_;
            CS_WARN("[QUEUE] Backpressure: " << items_.size() << "/" << capacity_
                    << " messages buffered (consumer is falling behind)");
        }
    }

private:
    const std::size_t capacity_;
    const DropPolicy policy_;
    std::size_t high_water_{1};

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_{false};
    bool above_high_water_{false};

    std::uint64_t pushed_{0};
    std::uint64_t dropped_{0};
    std::uint64_t high_water_events_{0};
};

} // namespace cirisstream::core::delivery
