#pragma once

#include "bridge/bridge_event.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

struct BridgeMessage {
    uint64_t seq = 0;
    BridgeEvent event = BridgeEvent::ToggleMic;
    std::string correlation_id; // empty for fire-and-forget events
};

// Long-poll transport towards the browser extension. Publishing wakes every
// waiting poller; a short history lets a poller that reconnects with its last
// sequence number catch up on events it missed.
class EventChannel {
public:
    static constexpr size_t HISTORY_SIZE = 32;

    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    uint64_t publish(BridgeEvent event, std::string correlation_id = {});

    // Waits for the first event with seq > since. Without a cursor only events
    // published after the call are returned. A cursor beyond last_seq() is
    // treated as stale and restarts from the oldest retained event. Returns
    // nullopt on timeout or when the channel is closed.
    std::optional<BridgeMessage> wait_next(std::chrono::milliseconds timeout,
                                           std::optional<uint64_t> since = std::nullopt);

    // Wakes all waiters; further waits return immediately until reopen().
    void close();
    void reopen();

    uint64_t last_seq() const;
    size_t waiting() const;

private:
    std::optional<BridgeMessage> find_after(uint64_t seq) const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<BridgeMessage> history_;
    uint64_t seq_ = 0;
    size_t waiting_ = 0;
    bool closed_ = false;
};
