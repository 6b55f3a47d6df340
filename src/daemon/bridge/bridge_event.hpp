#pragma once

#include <optional>
#include <string_view>

// Messages delivered to the browser extension.
enum class BridgeEvent {
    ToggleMic,
    MuteMic,
    UnmuteMic,
    ToggleSpeaker,
    VolumeUp,
    VolumeDown,
};

std::string_view to_string(BridgeEvent event);
std::optional<BridgeEvent> parse_bridge_event(std::string_view s);
