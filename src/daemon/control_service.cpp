#include "control_service.hpp"

#include <algorithm>
#include <fmt/core.h>

using json = nlohmann::json;

namespace {

const char* mode_name(MuteMode mode) {
    return to_string(mode).data();
}

} // namespace

ControlService::ControlService(AudioController& audio, BridgeCorrelator& correlator,
                               EventChannel& events, RequestLog* request_log,
                               LevelMonitor* level_monitor, Options options, bool verbose)
    : audio_(audio), correlator_(correlator), events_(events),
      request_log_(request_log), level_monitor_(level_monitor),
      options_(options), verbose_(verbose) {
    if (request_log_ && request_log_->is_open()) {
        request_count_.store(static_cast<uint64_t>(request_log_->total_served()),
                             std::memory_order_relaxed);
    }
}

Reply ControlService::status() {
    json resp = {
        {"bridgeMode", options_.bridge_mode},
        {"muteMode", options_.bridge_mode ? "bridge" : mode_name(audio_.mute_mode())},
        {"bridge", correlator_.state() == CorrelatorState::Idle ? "idle" : "awaiting"},
        {"requestCount", request_count()},
    };

    if (options_.bridge_mode) {
        resp["muted"] = bridge_muted_.load();
        resp["currentInputDevice"] = "Browser Extension";
    } else {
        auto muted = audio_.mic_muted();
        if (!muted) return error_reply(muted.error());
        resp["muted"] = *muted;

        auto device = audio_.input_device_name();
        resp["currentInputDevice"] = device ? *device : "";
    }

    auto volume = audio_.output_volume();
    if (volume) {
        resp["outputVolume"] = *volume;
        resp["outputMuted"] = *volume <= 0.0f;
    } else if (!options_.bridge_mode) {
        return error_reply(volume.error());
    }

    if (level_monitor_ && level_monitor_->is_running()) {
        resp["inputLevel"] = level_monitor_->level();
    }

    return {200, resp};
}

Reply ControlService::toggle_mic() {
    auto started = Clock::now();
    auto reply = options_.bridge_mode ? toggle_mic_bridged() : toggle_mic_direct();
    return finish("toggle-mic", std::move(reply), started);
}

Reply ControlService::toggle_mic_fast() {
    auto started = Clock::now();
    if (!options_.bridge_mode) {
        return finish("toggle-mic/fast", toggle_mic_direct(), started);
    }

    // Optimistic: assume the extension applies the change.
    bool predicted = !bridge_muted_.load();
    bridge_muted_.store(predicted);
    events_.publish(predicted ? BridgeEvent::MuteMic : BridgeEvent::UnmuteMic);
    log(fmt::format("Fast toggle dispatched ({})", predicted ? "mute" : "unmute"));

    return finish("toggle-mic/fast", {200, {{"status", "ok"}, {"muted", predicted}}}, started);
}

Reply ControlService::toggle_mic_direct() {
    auto res = audio_.toggle_mic();
    if (!res) return error_reply(res.error());

    log(fmt::format("Microphone {}", *res ? "muted" : "unmuted"));
    return {200, {{"status", "ok"}, {"muted", *res}}};
}

Reply ControlService::toggle_mic_bridged() {
    auto ticket = correlator_.open();
    if (!ticket) {
        if (ticket.error() == BridgeOutcome::Cancelled) {
            return {503, {{"status", "cancelled"}, {"message", "server is stopping"}}};
        }
        log("Bridge toggle rejected, another toggle is pending");
        return {409, {{"status", to_string(ticket.error())},
                      {"message", "a bridge toggle is already pending"}}};
    }

    events_.publish(BridgeEvent::ToggleMic, ticket->id);
    log("Bridge toggle " + ticket->id + " dispatched, awaiting confirmation");

    auto result = correlator_.await(*ticket);
    log(fmt::format("Bridge toggle {} finished: {}", ticket->id, to_string(result.outcome)));

    switch (result.outcome) {
        case BridgeOutcome::Confirmed:
            bridge_muted_.store(result.muted.value_or(bridge_muted_.load()));
            return {200, {{"status", "ok"}, {"muted", bridge_muted_.load()}}};
        case BridgeOutcome::TimedOut:
        case BridgeOutcome::Superseded:
            return {200, {{"status", to_string(result.outcome)}}};
        case BridgeOutcome::Cancelled:
            return {503, {{"status", to_string(result.outcome)},
                          {"message", "server is stopping"}}};
        case BridgeOutcome::Busy:
            break;
    }
    return {409, {{"status", "busy"}}};
}

Reply ControlService::volume() {
    auto v = audio_.output_volume();
    if (!v) return error_reply(v.error());
    return {200, {{"status", "ok"}, {"volume", *v}, {"muted", *v <= 0.0f}}};
}

Reply ControlService::volume_increase() {
    auto started = Clock::now();
    if (options_.bridge_mode) events_.publish(BridgeEvent::VolumeUp);
    return finish("volume/increase", volume_reply(audio_.increase_output_volume()), started);
}

Reply ControlService::volume_decrease() {
    auto started = Clock::now();
    if (options_.bridge_mode) events_.publish(BridgeEvent::VolumeDown);
    return finish("volume/decrease", volume_reply(audio_.decrease_output_volume()), started);
}

Reply ControlService::volume_toggle_mute() {
    auto started = Clock::now();
    if (options_.bridge_mode) events_.publish(BridgeEvent::ToggleSpeaker);

    auto muted = audio_.toggle_output_mute();
    if (!muted) return finish("volume/toggle-mute", error_reply(muted.error()), started);

    auto v = audio_.output_volume();
    if (!v) return finish("volume/toggle-mute", error_reply(v.error()), started);

    return finish("volume/toggle-mute",
                  {200, {{"status", "ok"}, {"volume", *v}, {"muted", *muted}}}, started);
}

Reply ControlService::volume_set(const std::string& body) {
    auto started = Clock::now();

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return finish("volume/set", bad_request(std::string("malformed body: ") + e.what()), started);
    }

    if (!j.is_object() || !j.contains("volume") || !j["volume"].is_number()) {
        return finish("volume/set", bad_request("body must be {\"volume\": <number>}"), started);
    }

    double v = j["volume"].get<double>();
    if (v < 0.0 || v > 1.0) {
        return finish("volume/set",
                      bad_request(fmt::format("volume {} outside [0.0, 1.0]", v)), started);
    }

    return finish("volume/set", volume_reply(audio_.set_output_volume(static_cast<float>(v))),
                  started);
}

Reply ControlService::volume_reply(const std::expected<float, AudioError>& res) {
    if (!res) return error_reply(res.error());
    return {200, {{"status", "ok"}, {"volume", *res}}};
}

Reply ControlService::mic_level() {
    if (!level_monitor_ || !level_monitor_->is_running()) {
        return {404, {{"status", "error"}, {"message", "input level monitoring is disabled"}}};
    }
    return {200, {{"status", "ok"}, {"level", level_monitor_->level()}}};
}

Reply ControlService::bridge_mic_state(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return bad_request(std::string("malformed body: ") + e.what());
    }

    if (!j.is_object() || !j.contains("muted") || !j["muted"].is_boolean()) {
        return bad_request("body must be {\"muted\": <bool>}");
    }

    bool muted = j["muted"].get<bool>();
    std::string id;
    if (j.contains("id")) {
        if (!j["id"].is_string()) return bad_request("id must be a string");
        id = j["id"].get<std::string>();
    }

    bridge_muted_.store(muted);
    bool correlated = correlator_.confirm(muted, id);
    if (correlated && id.empty()) {
        fmt::print(stderr, "[micdrop] Warning: mic-state report without id attributed to the "
                           "pending toggle; extensions should echo the polled id\n");
    }
    log(fmt::format("Extension reported {}{}", muted ? "muted" : "unmuted",
                    correlated ? "" : " (no pending toggle)"));

    return {200, {{"status", "updated"}, {"muted", muted}, {"correlated", correlated}}};
}

Reply ControlService::bridge_poll(std::optional<uint64_t> since) {
    auto msg = events_.wait_next(options_.poll_timeout, since);
    if (!msg) return {204, nullptr};

    json resp = {{"event", std::string(to_string(msg->event))}, {"seq", msg->seq}};
    if (!msg->correlation_id.empty()) resp["id"] = msg->correlation_id;
    return {200, resp};
}

Reply ControlService::history(int limit) {
    if (!request_log_ || !request_log_->is_open()) {
        return {404, {{"status", "error"}, {"message", "history is disabled"}}};
    }

    limit = std::clamp(limit, 1, 100);
    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : request_log_->recent(limit)) {
        json entry = {
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"route", e.route},
            {"status", e.status},
            {"latency_ms", e.latency_ms},
        };
        entry["muted"] = e.muted ? json(*e.muted) : json(nullptr);
        entry["volume"] = e.volume ? json(*e.volume) : json(nullptr);
        resp["entries"].push_back(std::move(entry));
    }
    return {200, resp};
}

std::string ControlService::status_page() {
    std::string state;
    if (options_.bridge_mode) {
        state = bridge_muted_.load() ? "Muted" : "Active";
    } else {
        auto muted = audio_.mic_muted();
        state = !muted ? "Unavailable" : (*muted ? "Muted" : "Active");
    }

    return fmt::format(R"(<!DOCTYPE html>
<html>
<head><title>micdrop</title><meta charset="utf-8"></head>
<body style="font-family: system-ui; text-align: center; padding: 50px;">
<h1>micdrop {}</h1>
<p style="font-size: 24px; font-weight: bold;">{}</p>
<p style="color: #888; font-size: 12px;">Listening on port {}</p>
</body>
</html>
)", options_.bridge_mode ? "bridge" : "control", state, options_.port);
}

void ControlService::begin_serving() {
    correlator_.reopen();
    events_.reopen();
}

void ControlService::drain() {
    events_.close();
    correlator_.close();
}

Reply ControlService::finish(const std::string& route, Reply reply, Clock::time_point started) {
    request_count_.fetch_add(1, std::memory_order_relaxed);

    if (request_log_ && request_log_->is_open()) {
        RequestRecord rec;
        rec.route = route;
        rec.status = reply.body.is_object() ? reply.body.value("status", "") : "";
        if (reply.body.contains("muted") && reply.body["muted"].is_boolean()) {
            rec.muted = reply.body["muted"].get<bool>();
        }
        if (reply.body.contains("volume") && reply.body["volume"].is_number()) {
            rec.volume = reply.body["volume"].get<double>();
        }
        rec.latency_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        request_log_->insert(rec);
    }

    return reply;
}

Reply ControlService::error_reply(const AudioError& err) {
    fmt::print(stderr, "[micdrop] audio error: {}\n", err.message);
    return {500, {{"status", "error"}, {"message", err.message}}};
}

Reply ControlService::bad_request(const std::string& message) {
    return {400, {{"status", "error"}, {"message", message}}};
}

void ControlService::log(const std::string& msg) {
    if (verbose_) {
        fmt::print(stderr, "[micdrop] {}\n", msg);
    }
}
