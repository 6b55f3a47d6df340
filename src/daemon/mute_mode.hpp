#pragma once

#include <optional>
#include <string>
#include <string_view>

// Mechanism used to realize "microphone muted".
enum class MuteMode { HardwareMute, VolumeZero, DeviceSwitch };

inline std::string_view to_string(MuteMode mode) {
    switch (mode) {
        case MuteMode::HardwareMute: return "hardware";
        case MuteMode::VolumeZero: return "volume";
        case MuteMode::DeviceSwitch: return "device-switch";
    }
    return "hardware";
}

inline std::optional<MuteMode> parse_mute_mode(std::string_view s) {
    if (s == "hardware" || s == "hardware-mute") return MuteMode::HardwareMute;
    if (s == "volume" || s == "volume-zero") return MuteMode::VolumeZero;
    if (s == "device-switch") return MuteMode::DeviceSwitch;
    return std::nullopt;
}
