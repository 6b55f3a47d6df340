#include "bridge/bridge_event.hpp"

#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<BridgeEvent, std::string_view>, 6> EVENT_NAMES = {{
    {BridgeEvent::ToggleMic, "toggle-mic"},
    {BridgeEvent::MuteMic, "mute-mic"},
    {BridgeEvent::UnmuteMic, "unmute-mic"},
    {BridgeEvent::ToggleSpeaker, "toggle-speaker"},
    {BridgeEvent::VolumeUp, "volume-up"},
    {BridgeEvent::VolumeDown, "volume-down"},
}};

} // namespace

std::string_view to_string(BridgeEvent event) {
    for (auto& [e, name] : EVENT_NAMES) {
        if (e == event) return name;
    }
    return "toggle-mic";
}

std::optional<BridgeEvent> parse_bridge_event(std::string_view s) {
    for (auto& [e, name] : EVENT_NAMES) {
        if (name == s) return e;
    }
    return std::nullopt;
}
