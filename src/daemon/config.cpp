#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int64_t MAX_TIMEOUT_MS = 10 * 60 * 1000;

void load_server(const json& s, Config::Server& out) {
    if (s.contains("enabled")) out.enabled = s["enabled"].get<bool>();
    if (s.contains("port")) {
        int port = s["port"].get<int>();
        if (port >= 1 && port <= 65535) {
            out.port = port;
        } else {
            fmt::print(stderr, "config: server.port {} out of range, using {}\n", port, out.port);
        }
    }
    if (s.contains("bind_address")) out.bind_address = s["bind_address"].get<std::string>();
    if (s.contains("cors")) out.cors = s["cors"].get<bool>();
}

void load_audio(const json& a, Config::Audio& out) {
    if (a.contains("mute_mode")) {
        auto name = a["mute_mode"].get<std::string>();
        if (auto mode = parse_mute_mode(name)) {
            out.mute_mode = *mode;
        } else {
            fmt::print(stderr, "config: unknown audio.mute_mode '{}', using '{}'\n",
                       name, to_string(out.mute_mode));
        }
    }
    if (a.contains("volume_step")) {
        float step = a["volume_step"].get<float>();
        if (step > 0.0f && step <= 1.0f) {
            out.volume_step = step;
        } else {
            fmt::print(stderr, "config: audio.volume_step {} out of range, using {}\n",
                       step, out.volume_step);
        }
    }
    if (a.contains("unmute_volume")) {
        float v = a["unmute_volume"].get<float>();
        if (v > 0.0f && v <= 1.0f) {
            out.unmute_volume = v;
        } else {
            fmt::print(stderr, "config: audio.unmute_volume {} out of range, using {}\n",
                       v, out.unmute_volume);
        }
    }
    if (a.contains("null_device")) out.null_device = a["null_device"].get<std::string>();
    if (a.contains("monitor_input_level")) out.monitor_input_level = a["monitor_input_level"].get<bool>();
}

void load_bridge(const json& b, Config::Bridge& out) {
    if (b.contains("enabled")) out.enabled = b["enabled"].get<bool>();
    if (b.contains("timeout_ms")) {
        auto ms = b["timeout_ms"].get<int64_t>();
        if (ms >= 1 && ms <= MAX_TIMEOUT_MS) {
            out.timeout_ms = static_cast<uint32_t>(ms);
        } else {
            fmt::print(stderr, "config: bridge.timeout_ms {} out of range, using {}\n",
                       ms, out.timeout_ms);
        }
    }
    if (b.contains("poll_timeout_ms")) {
        auto ms = b["poll_timeout_ms"].get<int64_t>();
        if (ms >= 1 && ms <= MAX_TIMEOUT_MS) {
            out.poll_timeout_ms = static_cast<uint32_t>(ms);
        } else {
            fmt::print(stderr, "config: bridge.poll_timeout_ms {} out of range, using {}\n",
                       ms, out.poll_timeout_ms);
        }
    }
    if (b.contains("busy_policy")) {
        auto policy = b["busy_policy"].get<std::string>();
        if (policy == "reject") {
            out.busy_policy = Config::BusyPolicy::Reject;
        } else if (policy == "supersede") {
            out.busy_policy = Config::BusyPolicy::Supersede;
        } else {
            fmt::print(stderr, "config: unknown bridge.busy_policy '{}', using 'reject'\n", policy);
            out.busy_policy = Config::BusyPolicy::Reject;
        }
    }
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        fmt::print(stderr, "config: could not open {}, using defaults\n", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) load_server(j["server"], cfg.server);
        if (j.contains("audio")) load_audio(j["audio"], cfg.audio);
        if (j.contains("bridge")) load_bridge(j["bridge"], cfg.bridge);

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("max_entries")) {
                int n = h["max_entries"].get<int>();
                if (n >= 1) {
                    cfg.history.max_entries = n;
                } else {
                    fmt::print(stderr, "config: history.max_entries {} out of range, using {}\n",
                               n, cfg.history.max_entries);
                }
            }
        }

    } catch (const json::exception& e) {
        fmt::print(stderr, "config: parse error: {}\n", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto path = default_path();
    if (path.empty()) return Config{};

    if (fs::exists(path)) {
        return load(path);
    }
    return Config{};
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}
