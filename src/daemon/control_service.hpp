#pragma once

#include "audio_controller.hpp"
#include "bridge/correlator.hpp"
#include "bridge/event_channel.hpp"
#include "platform/level_monitor.hpp"
#include "storage/request_log.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct Reply {
    int status = 200;
    nlohmann::json body;
};

// Request semantics of the control endpoint, independent of the HTTP layer.
// Every method is safe to call from concurrent handler threads.
class ControlService {
public:
    struct Options {
        bool bridge_mode = false;
        std::chrono::milliseconds poll_timeout{30000};
        int port = 8765;
    };

    // request_log and level_monitor are optional collaborators.
    ControlService(AudioController& audio, BridgeCorrelator& correlator,
                   EventChannel& events, RequestLog* request_log,
                   LevelMonitor* level_monitor, Options options, bool verbose = false);

    ControlService(const ControlService&) = delete;
    ControlService& operator=(const ControlService&) = delete;

    Reply status();
    Reply toggle_mic();
    Reply toggle_mic_fast();

    Reply volume();
    Reply volume_increase();
    Reply volume_decrease();
    Reply volume_toggle_mute();
    Reply volume_set(const std::string& body);

    Reply mic_level();

    // The extension's state report, {"muted": bool, "id"?: string}. Extensions
    // should echo the id from the polled toggle-mic event: a report without
    // one resolves whichever toggle is pending and is logged as a warning.
    Reply bridge_mic_state(const std::string& body);
    Reply bridge_poll(std::optional<uint64_t> since);

    Reply history(int limit);
    std::string status_page();

    // Called by the endpoint around its serving lifetime. drain() releases
    // every handler parked on the bridge so the listener can shut down.
    void begin_serving();
    void drain();

    bool bridge_mode() const { return options_.bridge_mode; }
    uint64_t request_count() const { return request_count_.load(std::memory_order_relaxed); }

private:
    using Clock = std::chrono::steady_clock;

    Reply toggle_mic_direct();
    Reply toggle_mic_bridged();
    Reply volume_reply(const std::expected<float, AudioError>& res);

    // Counts and records a control request, then returns the reply unchanged.
    Reply finish(const std::string& route, Reply reply, Clock::time_point started);

    static Reply error_reply(const AudioError& err);
    static Reply bad_request(const std::string& message);

    void log(const std::string& msg);

    AudioController& audio_;
    BridgeCorrelator& correlator_;
    EventChannel& events_;
    RequestLog* request_log_;
    LevelMonitor* level_monitor_;
    Options options_;
    bool verbose_;

    // Mic state as last reported by the extension.
    std::atomic<bool> bridge_muted_{false};
    std::atomic<uint64_t> request_count_{0};
};
