#include "bridge/event_channel.hpp"

uint64_t EventChannel::publish(BridgeEvent event, std::string correlation_id) {
    uint64_t seq;
    {
        std::lock_guard lock(mutex_);
        seq = ++seq_;
        history_.push_back({seq, event, std::move(correlation_id)});
        while (history_.size() > HISTORY_SIZE) history_.pop_front();
    }
    cv_.notify_all();
    return seq;
}

std::optional<BridgeMessage> EventChannel::wait_next(std::chrono::milliseconds timeout,
                                                     std::optional<uint64_t> since) {
    std::unique_lock lock(mutex_);
    if (closed_) return std::nullopt;

    uint64_t cursor = since.value_or(seq_);
    // A cursor ahead of the counter comes from a previous daemon process;
    // replay everything this process still retains.
    if (cursor > seq_) cursor = 0;
    if (auto msg = find_after(cursor)) return msg;

    ++waiting_;
    bool ready = cv_.wait_for(lock, timeout, [&] { return closed_ || seq_ > cursor; });
    --waiting_;

    if (!ready || closed_) return std::nullopt;
    return find_after(cursor);
}

void EventChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void EventChannel::reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
}

uint64_t EventChannel::last_seq() const {
    std::lock_guard lock(mutex_);
    return seq_;
}

size_t EventChannel::waiting() const {
    std::lock_guard lock(mutex_);
    return waiting_;
}

std::optional<BridgeMessage> EventChannel::find_after(uint64_t seq) const {
    for (const auto& msg : history_) {
        if (msg.seq > seq) return msg;
    }
    return std::nullopt;
}
