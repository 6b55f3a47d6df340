#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

using Catch::Approx;

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "micdrop_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.enabled);
        REQUIRE(cfg.server.port == 8765);
        REQUIRE(cfg.server.bind_address == "0.0.0.0");
        REQUIRE(cfg.server.cors);
        REQUIRE(cfg.audio.mute_mode == MuteMode::HardwareMute);
        REQUIRE(cfg.audio.volume_step == Approx(0.1f));
        REQUIRE(cfg.audio.unmute_volume == Approx(0.5f));
        REQUIRE(cfg.audio.null_device.empty());
        REQUIRE_FALSE(cfg.audio.monitor_input_level);
        REQUIRE_FALSE(cfg.bridge.enabled);
        REQUIRE(cfg.bridge.timeout_ms == 5000);
        REQUIRE(cfg.bridge.poll_timeout_ms == 30000);
        REQUIRE(cfg.bridge.busy_policy == Config::BusyPolicy::Reject);
        REQUIRE(cfg.history.enabled);
        REQUIRE(cfg.history.max_entries == 1000);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": { "enabled": false, "port": 9000, "bind_address": "127.0.0.1", "cors": false },
            "audio": {
                "mute_mode": "device-switch",
                "volume_step": 0.05,
                "unmute_volume": 0.8,
                "null_device": "null-source",
                "monitor_input_level": true
            },
            "bridge": { "enabled": true, "timeout_ms": 2500, "poll_timeout_ms": 10000,
                        "busy_policy": "supersede" },
            "history": { "enabled": false, "max_entries": 50 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.server.enabled);
        REQUIRE(cfg.server.port == 9000);
        REQUIRE(cfg.server.bind_address == "127.0.0.1");
        REQUIRE_FALSE(cfg.server.cors);
        REQUIRE(cfg.audio.mute_mode == MuteMode::DeviceSwitch);
        REQUIRE(cfg.audio.volume_step == Approx(0.05f));
        REQUIRE(cfg.audio.unmute_volume == Approx(0.8f));
        REQUIRE(cfg.audio.null_device == "null-source");
        REQUIRE(cfg.audio.monitor_input_level);
        REQUIRE(cfg.bridge.enabled);
        REQUIRE(cfg.bridge.timeout_ms == 2500);
        REQUIRE(cfg.bridge.poll_timeout_ms == 10000);
        REQUIRE(cfg.bridge.busy_policy == Config::BusyPolicy::Supersede);
        REQUIRE_FALSE(cfg.history.enabled);
        REQUIRE(cfg.history.max_entries == 50);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "server": { "port": 9999 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.port == 9999);
        // Other fields retain defaults
        REQUIRE(cfg.server.bind_address == "0.0.0.0");
        REQUIRE(cfg.audio.mute_mode == MuteMode::HardwareMute);
        REQUIRE_FALSE(cfg.bridge.enabled);
    }

    SECTION("MuteModeSpellings") {
        TmpFile volume(R"({ "audio": { "mute_mode": "volume" } })");
        REQUIRE(Config::load(volume.path).audio.mute_mode == MuteMode::VolumeZero);

        TmpFile long_name(R"({ "audio": { "mute_mode": "volume-zero" } })");
        REQUIRE(Config::load(long_name.path).audio.mute_mode == MuteMode::VolumeZero);

        TmpFile hardware(R"({ "audio": { "mute_mode": "hardware-mute" } })");
        REQUIRE(Config::load(hardware.path).audio.mute_mode == MuteMode::HardwareMute);
    }

    SECTION("InvalidValuesFallBackToDefaults") {
        TmpFile f(R"({
            "server": { "port": 70000 },
            "audio": { "mute_mode": "telepathy", "volume_step": 0, "unmute_volume": 3 },
            "bridge": { "busy_policy": "queue", "timeout_ms": 1200 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.port == 8765);
        REQUIRE(cfg.audio.mute_mode == MuteMode::HardwareMute);
        REQUIRE(cfg.audio.volume_step == Approx(0.1f));
        REQUIRE(cfg.audio.unmute_volume == Approx(0.5f));
        REQUIRE(cfg.bridge.busy_policy == Config::BusyPolicy::Reject);
        // Valid keys beside invalid ones still apply
        REQUIRE(cfg.bridge.timeout_ms == 1200);
    }

    SECTION("ZeroTimeoutsAndHistorySizeFallBackToDefaults") {
        TmpFile f(R"({
            "bridge": { "timeout_ms": 0, "poll_timeout_ms": -5 },
            "history": { "max_entries": 0 }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.bridge.timeout_ms == 5000);
        REQUIRE(cfg.bridge.poll_timeout_ms == 30000);
        REQUIRE(cfg.history.max_entries == 1000);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "server": { "port": "eighty" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.port == 8765);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.server.port == 8765);
        REQUIRE(cfg.audio.mute_mode == MuteMode::HardwareMute);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/micdrop_test_nonexistent_config_file.json");
        REQUIRE(cfg.server.port == 8765);
        REQUIRE(cfg.bridge.timeout_ms == 5000);
    }

    SECTION("DefaultPathFollowsXdg") {
        const char* saved = std::getenv("XDG_CONFIG_HOME");
        std::string old = saved ? saved : "";

        setenv("XDG_CONFIG_HOME", "/tmp/micdrop-xdg", 1);
        REQUIRE(Config::default_path() == "/tmp/micdrop-xdg/micdrop/config.json");

        if (saved) setenv("XDG_CONFIG_HOME", old.c_str(), 1);
        else unsetenv("XDG_CONFIG_HOME");
    }
}
