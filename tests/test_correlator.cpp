#include <catch2/catch_test_macros.hpp>

#include "bridge/correlator.hpp"

#include <chrono>
#include <future>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("BridgeCorrelator", "[bridge]") {

    SECTION("InitiallyIdle") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 1000ms);
        REQUIRE(c.state() == CorrelatorState::Idle);
        REQUIRE_FALSE(c.pending_id().has_value());
    }

    SECTION("OpenAwaitsConfirmation") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 1000ms);
        auto ticket = c.open();
        REQUIRE(ticket.has_value());
        REQUIRE(ticket->id.size() == 32);
        REQUIRE(c.state() == CorrelatorState::AwaitingConfirmation);
        REQUIRE(c.pending_id() == ticket->id);
    }

    SECTION("IdsAreUnique") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Supersede, 1000ms);
        auto a = c.open();
        auto b = c.open();
        REQUIRE(a->id != b->id);
    }

    SECTION("ConfirmResolvesWithMutedState") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 5000ms);
        auto ticket = c.open();

        bool accepted = false;
        std::thread extension([&] {
            std::this_thread::sleep_for(20ms);
            accepted = c.confirm(true);
        });

        auto result = c.await(*ticket);
        extension.join();

        REQUIRE(accepted);
        REQUIRE(result.outcome == BridgeOutcome::Confirmed);
        REQUIRE(result.muted == true);
        REQUIRE(c.state() == CorrelatorState::Idle);
    }

    SECTION("ConfirmWithMatchingId") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 5000ms);
        auto ticket = c.open();
        REQUIRE(c.confirm(false, ticket->id));
        auto result = c.await(*ticket);
        REQUIRE(result.outcome == BridgeOutcome::Confirmed);
        REQUIRE(result.muted == false);
    }

    SECTION("ConfirmWithForeignIdIsDiscarded") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 5000ms);
        auto ticket = c.open();
        REQUIRE_FALSE(c.confirm(true, "not-the-pending-id"));
        REQUIRE(c.state() == CorrelatorState::AwaitingConfirmation);
        c.cancel();
    }

    SECTION("UnconfirmedTimesOutAndReturnsToIdle") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 50ms);
        auto ticket = c.open();

        auto started = std::chrono::steady_clock::now();
        auto result = c.await(*ticket);
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(result.outcome == BridgeOutcome::TimedOut);
        REQUIRE_FALSE(result.muted.has_value());
        REQUIRE(elapsed >= 40ms);
        REQUIRE(c.state() == CorrelatorState::Idle);
    }

    SECTION("LateConfirmationDoesNotAffectNextCorrelation") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 30ms);
        auto first = c.open();
        REQUIRE(c.await(*first).outcome == BridgeOutcome::TimedOut);

        // Late report for the first toggle: nothing is pending.
        REQUIRE_FALSE(c.confirm(true, first->id));
        REQUIRE_FALSE(c.confirm(true));

        auto second = c.open();
        REQUIRE(second.has_value());
        // A late report carrying the old id must not resolve the new slot.
        REQUIRE_FALSE(c.confirm(true, first->id));
        REQUIRE(c.state() == CorrelatorState::AwaitingConfirmation);

        REQUIRE(c.confirm(false, second->id));
        auto result = c.await(*second);
        REQUIRE(result.outcome == BridgeOutcome::Confirmed);
        REQUIRE(result.muted == false);
    }

    SECTION("RejectPolicyReportsBusy") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 5000ms);
        auto first = c.open();
        auto second = c.open();
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error() == BridgeOutcome::Busy);
        REQUIRE(c.pending_id() == first->id);
        c.cancel();
    }

    SECTION("SupersedePolicyReleasesFirstWaiter") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Supersede, 5000ms);
        auto first = c.open();
        auto waiter = std::async(std::launch::async, [&] { return c.await(*first); });

        std::this_thread::sleep_for(20ms);
        auto second = c.open();
        REQUIRE(second.has_value());

        REQUIRE(waiter.get().outcome == BridgeOutcome::Superseded);
        REQUIRE(c.pending_id() == second->id);

        REQUIRE(c.confirm(true));
        REQUIRE(c.await(*second).outcome == BridgeOutcome::Confirmed);
    }

    SECTION("CancelReleasesWaiter") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 5000ms);
        auto ticket = c.open();
        auto waiter = std::async(std::launch::async, [&] { return c.await(*ticket); });

        std::this_thread::sleep_for(20ms);
        c.cancel();
        REQUIRE(waiter.get().outcome == BridgeOutcome::Cancelled);
        REQUIRE(c.state() == CorrelatorState::Idle);
    }

    SECTION("ClosedCorrelatorRefusesNewTickets") {
        BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 5000ms);
        auto pending = c.open();
        c.close();
        REQUIRE(c.await(*pending).outcome == BridgeOutcome::Cancelled);

        // A toggle arriving after shutdown began must not park a new waiter.
        auto late = c.open();
        REQUIRE_FALSE(late.has_value());
        REQUIRE(late.error() == BridgeOutcome::Cancelled);
        REQUIRE(c.state() == CorrelatorState::Idle);

        c.reopen();
        auto next = c.open();
        REQUIRE(next.has_value());
        REQUIRE(c.confirm(true, next->id));
        REQUIRE(c.await(*next).outcome == BridgeOutcome::Confirmed);
    }

    SECTION("ConfirmAndTimeoutRaceHasOneWinner") {
        for (int i = 0; i < 50; i++) {
            BridgeCorrelator c(BridgeCorrelator::Policy::Reject, 2ms);
            auto ticket = c.open();

            std::thread extension([&] {
                std::this_thread::sleep_for(2ms);
                c.confirm(true);
            });
            auto result = c.await(*ticket);
            extension.join();

            bool valid = result.outcome == BridgeOutcome::Confirmed ||
                         result.outcome == BridgeOutcome::TimedOut;
            REQUIRE(valid);
            REQUIRE(c.state() == CorrelatorState::Idle);
        }
    }

    SECTION("OutcomeNames") {
        REQUIRE(std::string(to_string(BridgeOutcome::Confirmed)) == "ok");
        REQUIRE(std::string(to_string(BridgeOutcome::TimedOut)) == "timeout");
        REQUIRE(std::string(to_string(BridgeOutcome::Superseded)) == "superseded");
        REQUIRE(std::string(to_string(BridgeOutcome::Busy)) == "busy");
        REQUIRE(std::string(to_string(BridgeOutcome::Cancelled)) == "cancelled");
    }
}
