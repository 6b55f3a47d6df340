#pragma once

#include "mute_mode.hpp"

#include <cstdint>
#include <string>

struct Config {
    struct Server {
        bool enabled = true;
        int port = 8765;
        std::string bind_address = "0.0.0.0";
        bool cors = true;
    } server;

    struct Audio {
        MuteMode mute_mode = MuteMode::HardwareMute;
        float volume_step = 0.1f;
        float unmute_volume = 0.5f;
        std::string null_device; // node name of the silent source for device-switch mode
        bool monitor_input_level = false;
    } audio;

    enum class BusyPolicy { Reject, Supersede };

    struct Bridge {
        bool enabled = false;
        uint32_t timeout_ms = 5000;
        uint32_t poll_timeout_ms = 30000;
        BusyPolicy busy_policy = BusyPolicy::Reject;
    } bridge;

    struct History {
        bool enabled = true;
        int max_entries = 1000;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();
};
