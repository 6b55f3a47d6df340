#include <catch2/catch_test_macros.hpp>

#include "bridge/bridge_event.hpp"
#include "mute_mode.hpp"

TEST_CASE("BridgeEvent names", "[bridge]") {

    SECTION("WireNames") {
        REQUIRE(to_string(BridgeEvent::ToggleMic) == "toggle-mic");
        REQUIRE(to_string(BridgeEvent::MuteMic) == "mute-mic");
        REQUIRE(to_string(BridgeEvent::UnmuteMic) == "unmute-mic");
        REQUIRE(to_string(BridgeEvent::ToggleSpeaker) == "toggle-speaker");
        REQUIRE(to_string(BridgeEvent::VolumeUp) == "volume-up");
        REQUIRE(to_string(BridgeEvent::VolumeDown) == "volume-down");
    }

    SECTION("ParseKnownNames") {
        REQUIRE(parse_bridge_event("toggle-speaker") == BridgeEvent::ToggleSpeaker);
        REQUIRE(parse_bridge_event("volume-down") == BridgeEvent::VolumeDown);
    }

    SECTION("ParseUnknownName") {
        REQUIRE_FALSE(parse_bridge_event("toggle_mic").has_value());
        REQUIRE_FALSE(parse_bridge_event("").has_value());
    }
}

TEST_CASE("MuteMode names", "[config]") {
    REQUIRE(to_string(MuteMode::HardwareMute) == "hardware");
    REQUIRE(to_string(MuteMode::VolumeZero) == "volume");
    REQUIRE(to_string(MuteMode::DeviceSwitch) == "device-switch");
    REQUIRE(parse_mute_mode("device-switch") == MuteMode::DeviceSwitch);
    REQUIRE_FALSE(parse_mute_mode("Hardware").has_value());
}
