// ============================================================================
// Subscription Manager
// ============================================================================
//
// Keeps the *desired* subscription set (channel -> optional filter) and the
// control frames that still have to reach the server.
//
// • subscribe() inserts or replaces entries. While live, a subscribe frame
//   for just those channels is queued for the pump
// • unsubscribe() removes entries. While live, an unsubscribe frame is
//   queued. Removals are never replayed
// • on_connected() returns ONE batch frame with the whole set (replay) and
//   discards control frames queued for the previous connection
// • on_disconnected() stops queueing; changes take effect on next replay
//
// Changes made while offline are folded into the desired set, so the next
// replay sends each channel exactly once with its latest filter.
//
// Threading:
// • All operations are serialized by an internal mutex
// • Callers on any thread; the pump drains take_outbox()
//
// ============================================================================
#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cirisstream/core/protocol/ciris/schema/filter.hpp"
#include "cirisstream/core/protocol/ciris/schema/subscribe.hpp"
#include "cirisstream/core/protocol/ciris/schema/unsubscribe.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace cirisstream::core::protocol::ciris::subscription {

class Manager {
public:
    Manager() = default;
    ~Manager() = default;

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    inline void subscribe(std::string channel, lcr::optional<schema::Filter> filter = {}) {
        schema::Subscribe req;
        req.add(std::move(channel), std::move(filter));
        subscribe(req);
    }

    inline void subscribe(const schema::Subscribe& req) {
        if (req.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : req.channels) {
            desired_.add(entry.channel, entry.filter);
        }
        CS_DEBUG("[SUBMGR] Subscribe " << req.size() << " channel(s) (desired set: " << desired_.size() << ")");
        if (live_) {
            outbox_.push_back(req.to_json());
        }
    }

    inline void unsubscribe(const std::vector<std::string>& channels) {
        if (channels.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& channel : channels) {
            erase_(channel);
        }
        CS_DEBUG("[SUBMGR] Unsubscribe " << channels.size() << " channel(s) (desired set: " << desired_.size() << ")");
        if (live_) {
            outbox_.push_back(schema::Unsubscribe{channels}.to_json());
        }
    }

    // Arbitrary outbound frame. Rejected while offline (not replayed).
    [[nodiscard]]
    inline bool enqueue(std::string frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!live_) {
            return false;
        }
        outbox_.push_back(std::move(frame));
        return true;
    }

    // Replay: returns the whole desired set as one frame (empty when nothing
    // is subscribed). Pending frames of the previous connection are dropped.
    [[nodiscard]]
    inline lcr::optional<schema::Subscribe> on_connected() {
        std::lock_guard<std::mutex> lock(mutex_);
        live_ = true;
        if (!outbox_.empty()) {
            CS_DEBUG("[SUBMGR] Discarding " << outbox_.size() << " stale control frame(s)");
            outbox_.clear();
        }
        if (desired_.empty()) {
            return {};
        }
        CS_INFO("[SUBMGR] Replaying " << desired_.size() << " subscription(s)");
        return lcr::optional<schema::Subscribe>{desired_};
    }

    inline void on_disconnected() {
        std::lock_guard<std::mutex> lock(mutex_);
        live_ = false;
        outbox_.clear();
    }

    // Control frames in FIFO order
    [[nodiscard]]
    inline std::deque<std::string> take_outbox() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::deque<std::string> out;
        out.swap(outbox_);
        return out;
    }

    // Consistent copy of the desired set
    [[nodiscard]]
    inline schema::Subscribe snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return desired_;
    }

    [[nodiscard]]
    inline bool contains(const std::string& channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : desired_.channels) {
            if (entry.channel == channel) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]]
    inline std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return desired_.size();
    }

    [[nodiscard]]
    inline bool live() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_;
    }

    // Drops the desired set and pending frames (explicit disconnect)
    inline void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        desired_.channels.clear();
        outbox_.clear();
        live_ = false;
    }

private:
    // Requires mutex_ held
    inline void erase_(const std::string& channel) {
        auto& v = desired_.channels;
        for (auto it = v.begin(); it != v.end(); ++it) {
            if (it->channel == channel) {
                v.erase(it);
                return;
            }
        }
    }

private:
    mutable std::mutex mutex_;
    schema::Subscribe desired_;
    std::deque<std::string> outbox_;
    bool live_{false};
};

} // namespace cirisstream::core::protocol::ciris::subscription
