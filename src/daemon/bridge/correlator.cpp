#include "bridge/correlator.hpp"

#include <fmt/core.h>
#include <random>

BridgeCorrelator::BridgeCorrelator(Policy policy, std::chrono::milliseconds timeout)
    : policy_(policy), timeout_(timeout) {}

BridgeCorrelator::~BridgeCorrelator() {
    cancel();
}

std::expected<BridgeCorrelator::Ticket, BridgeOutcome> BridgeCorrelator::open() {
    std::lock_guard lock(mutex_);
    if (closed_) return std::unexpected(BridgeOutcome::Cancelled);

    if (pending_) {
        if (policy_ == Policy::Reject) {
            return std::unexpected(BridgeOutcome::Busy);
        }
        resolve_locked({BridgeOutcome::Superseded, std::nullopt});
    }

    auto now = Clock::now();
    Pending entry{
        .id = make_id(),
        .created_at = now,
        .deadline = now + timeout_,
        .promise = {},
    };

    Ticket ticket{
        .id = entry.id,
        .deadline = entry.deadline,
        .result = entry.promise.get_future(),
    };
    pending_.emplace(std::move(entry));
    return ticket;
}

BridgeResult BridgeCorrelator::await(Ticket& ticket) {
    if (ticket.result.wait_until(ticket.deadline) != std::future_status::ready) {
        std::lock_guard lock(mutex_);
        // A confirmation may have won the slot between the wait and the lock.
        if (pending_ && pending_->id == ticket.id) {
            resolve_locked({BridgeOutcome::TimedOut, std::nullopt});
        }
    }
    return ticket.result.get();
}

bool BridgeCorrelator::confirm(bool muted, const std::string& id) {
    std::lock_guard lock(mutex_);
    if (!pending_) return false;
    if (!id.empty() && id != pending_->id) return false;

    resolve_locked({BridgeOutcome::Confirmed, muted});
    return true;
}

void BridgeCorrelator::cancel() {
    std::lock_guard lock(mutex_);
    if (pending_) {
        resolve_locked({BridgeOutcome::Cancelled, std::nullopt});
    }
}

void BridgeCorrelator::close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
    if (pending_) {
        resolve_locked({BridgeOutcome::Cancelled, std::nullopt});
    }
}

void BridgeCorrelator::reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
}

CorrelatorState BridgeCorrelator::state() const {
    std::lock_guard lock(mutex_);
    return pending_ ? CorrelatorState::AwaitingConfirmation : CorrelatorState::Idle;
}

std::optional<std::string> BridgeCorrelator::pending_id() const {
    std::lock_guard lock(mutex_);
    if (!pending_) return std::nullopt;
    return pending_->id;
}

void BridgeCorrelator::resolve_locked(BridgeResult result) {
    pending_->promise.set_value(result);
    pending_.reset();
}

std::string BridgeCorrelator::make_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("{:016x}{:016x}", rng(), rng());
}

const char* to_string(BridgeOutcome outcome) {
    switch (outcome) {
        case BridgeOutcome::Confirmed: return "ok";
        case BridgeOutcome::TimedOut: return "timeout";
        case BridgeOutcome::Superseded: return "superseded";
        case BridgeOutcome::Busy: return "busy";
        case BridgeOutcome::Cancelled: return "cancelled";
    }
    return "error";
}
