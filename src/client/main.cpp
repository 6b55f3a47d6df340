#include "http_client.hpp"

#include <charconv>
#include <cstdlib>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    fmt::print(stderr, "Usage: {} [--host H] [--port P] <command> [options]\n", prog);
    fmt::print(stderr, "Commands:\n");
    fmt::print(stderr, "  status                          Show daemon status\n");
    fmt::print(stderr, "  toggle [--fast]                 Toggle the microphone\n");
    fmt::print(stderr, "  volume up|down|mute|get         Step, mute or read the output volume\n");
    fmt::print(stderr, "  volume set <0.0-1.0>            Set the output volume\n");
    fmt::print(stderr, "  history [--limit N]             Show recent control requests\n");
    fmt::print(stderr, "  confirm true|false              Report the mic state as the extension\n");
    fmt::print(stderr, "  poll                            Wait for the next bridge event\n");
}

static int percent(double v) {
    return static_cast<int>(v * 100.0 + 0.5);
}

// Prints the daemon's error message; returns true when the reply is a failure.
static bool report_error(const HttpResponse& resp) {
    bool failed = resp.status >= 400 ||
                  (resp.body.is_object() && resp.body.value("status", "") == "error");
    if (failed) {
        std::string message = resp.body.is_object() ? resp.body.value("message", "") : "";
        if (message.empty() && resp.body.is_object()) message = resp.body.value("status", "");
        fmt::print(stderr, "Error ({}): {}\n", resp.status,
                   message.empty() ? "request failed" : message);
    }
    return failed;
}

static void print_status(const json& s) {
    bool bridge = s.value("bridgeMode", false);
    fmt::print("Microphone: {}\n", s.value("muted", false) ? "muted" : "live");
    fmt::print("Input device: {}\n", s.value("currentInputDevice", ""));
    if (s.contains("outputVolume")) {
        fmt::print("Output volume: {}%{}\n", percent(s["outputVolume"].get<double>()),
                   s.value("outputMuted", false) ? " (muted)" : "");
    }
    fmt::print("Mode: {}{}\n", s.value("muteMode", ""),
               bridge ? fmt::format(" ({})", s.value("bridge", "idle")) : "");
    if (s.contains("inputLevel")) {
        fmt::print("Input level: {}%\n", percent(s["inputLevel"].get<double>()));
    }
    fmt::print("Requests served: {}\n", s.value("requestCount", 0));
}

static void print_toggle(const json& r) {
    auto status = r.value("status", "");
    if (status == "ok") {
        fmt::print("Microphone {}\n", r.value("muted", false) ? "muted" : "unmuted");
    } else if (status == "timeout") {
        fmt::print("No confirmation from the browser extension (timeout)\n");
    } else if (status == "superseded") {
        fmt::print("Superseded by a newer toggle\n");
    } else {
        fmt::print("{}\n", r.dump(2));
    }
}

int main(int argc, char* argv[]) {
    std::string host = "127.0.0.1";
    int port = 8765;
    std::vector<std::string> args;
    bool fast = false;
    int limit = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--fast") {
            fast = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];
    HttpClient client(host, port);
    std::expected<HttpResponse, std::string> resp;

    if (command == "status") {
        resp = client.get("/status");
    } else if (command == "toggle") {
        // Bridged toggles wait for the extension.
        resp = client.post(fast ? "/toggle-mic/fast" : "/toggle-mic", {}, 60);
    } else if (command == "volume") {
        std::string sub = args.size() > 1 ? args[1] : "get";
        if (sub == "up") {
            resp = client.post("/volume/increase");
        } else if (sub == "down") {
            resp = client.post("/volume/decrease");
        } else if (sub == "mute") {
            resp = client.post("/volume/toggle-mute");
        } else if (sub == "get") {
            resp = client.get("/volume");
        } else if (sub == "set" && args.size() > 2) {
            double v = 0.0;
            const auto& s = args[2];
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
            if (ec != std::errc() || ptr != s.data() + s.size()) {
                fmt::print(stderr, "Invalid volume: {}\n", s);
                return 1;
            }
            resp = client.post("/volume/set", json{{"volume", v}}.dump());
        } else {
            usage(argv[0]);
            return 1;
        }
    } else if (command == "history") {
        resp = client.get("/history?limit=" + std::to_string(limit));
    } else if (command == "confirm") {
        if (args.size() < 2 || (args[1] != "true" && args[1] != "false")) {
            usage(argv[0]);
            return 1;
        }
        resp = client.post("/bridge/mic-state", json{{"muted", args[1] == "true"}}.dump());
    } else if (command == "poll") {
        resp = client.get("/bridge/poll", 60);
    } else {
        fmt::print(stderr, "Unknown command: {}\n", command);
        usage(argv[0]);
        return 1;
    }

    if (!resp) {
        fmt::print(stderr, "Failed to reach micdrop at {}: {}\n", client.base_url(), resp.error());
        fmt::print(stderr, "Is micdrop running?\n");
        return 1;
    }

    if (report_error(*resp)) return 1;
    const json& body = resp->body;

    if (command == "status") {
        print_status(body);
    } else if (command == "toggle") {
        print_toggle(body);
        if (body.value("status", "") != "ok") return 1;
    } else if (command == "volume") {
        fmt::print("Volume: {}%{}\n", percent(body.value("volume", 0.0)),
                   body.value("muted", false) ? " (muted)" : "");
    } else if (command == "history") {
        for (auto& entry : body.value("entries", json::array())) {
            std::string detail;
            if (entry.contains("muted") && entry["muted"].is_boolean()) {
                detail = entry["muted"].get<bool>() ? " muted" : " unmuted";
            } else if (entry.contains("volume") && entry["volume"].is_number()) {
                detail = fmt::format(" volume {}%", percent(entry["volume"].get<double>()));
            }
            fmt::print("[{}] {} -> {}{} ({:.1f} ms)\n", entry.value("timestamp", ""),
                       entry.value("route", ""), entry.value("status", ""), detail,
                       entry.value("latency_ms", 0.0));
        }
    } else if (command == "confirm") {
        fmt::print("Reported {}{}\n", body.value("muted", false) ? "muted" : "unmuted",
                   body.value("correlated", false) ? " (matched a pending toggle)" : "");
    } else if (command == "poll") {
        if (resp->status == 204 || body.is_null()) {
            fmt::print("No events\n");
        } else {
            fmt::print("{} (seq {}){}\n", body.value("event", ""), body.value("seq", 0),
                       body.contains("id") ? " id " + body["id"].get<std::string>() : "");
        }
    }

    return 0;
}
