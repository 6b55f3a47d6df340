#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <string>

enum class CorrelatorState { Idle, AwaitingConfirmation };

enum class BridgeOutcome {
    Confirmed,  // the extension reported the resulting state
    TimedOut,   // no report before the deadline
    Superseded, // a newer toggle took the slot
    Busy,       // rejected, another toggle is still pending
    Cancelled,  // the endpoint is shutting down
};

struct BridgeResult {
    BridgeOutcome outcome = BridgeOutcome::TimedOut;
    std::optional<bool> muted;
};

// Single-slot correlation between a bridge-routed toggle and the extension's
// confirmation. The waiting request and the confirmation race to write the
// slot's result; the first write wins and the slot returns to Idle.
class BridgeCorrelator {
public:
    using Clock = std::chrono::steady_clock;

    enum class Policy { Reject, Supersede };

    struct Ticket {
        std::string id;
        Clock::time_point deadline;
        std::future<BridgeResult> result;
    };

    BridgeCorrelator(Policy policy, std::chrono::milliseconds timeout);
    ~BridgeCorrelator();

    BridgeCorrelator(const BridgeCorrelator&) = delete;
    BridgeCorrelator& operator=(const BridgeCorrelator&) = delete;

    // Opens a new correlation. Fails with Busy under the Reject policy while
    // another correlation is pending, and with Cancelled while closed.
    std::expected<Ticket, BridgeOutcome> open();

    // Blocks the calling thread until the ticket is resolved or its deadline
    // passes. Only the ticket's own future is waited on.
    BridgeResult await(Ticket& ticket);

    // Delivers the extension's report. An empty id is attributed to the
    // pending correlation. Returns false when the report was discarded.
    bool confirm(bool muted, const std::string& id = {});

    // Resolves the pending correlation, if any, with Cancelled.
    void cancel();

    // cancel() plus refusing new correlations until reopen().
    void close();
    void reopen();

    CorrelatorState state() const;
    std::optional<std::string> pending_id() const;
    std::chrono::milliseconds timeout() const { return timeout_; }
    Policy policy() const { return policy_; }

private:
    struct Pending {
        std::string id;
        Clock::time_point created_at;
        Clock::time_point deadline;
        std::promise<BridgeResult> promise;
    };

    // Writes the slot's result and clears it. Caller holds mutex_.
    void resolve_locked(BridgeResult result);

    static std::string make_id();

    Policy policy_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::optional<Pending> pending_;
    bool closed_ = false;
};

const char* to_string(BridgeOutcome outcome);
