#pragma once

#include "audio_controller.hpp"
#include "bridge/correlator.hpp"
#include "bridge/event_channel.hpp"
#include "config.hpp"
#include "control_service.hpp"
#include "http_server.hpp"
#include "platform/audio_mixer.hpp"
#include "platform/level_monitor.hpp"
#include "platform/port_probe.hpp"
#include "storage/request_log.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    // level_monitor and port_probe are optional. notify is called from the
    // mixer's thread after an audio change; the owner then calls
    // on_audio_changed() from its own loop.
    DaemonCore(Config config, bool verbose, AudioMixer& mixer,
               LevelMonitor* level_monitor, const PortProbe* port_probe,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens the history, builds the services and starts the endpoint when
    // enabled. An endpoint that cannot bind is reported and left stopped.
    void init();

    // Stops the endpoint, applies the new settings and starts it again.
    void reload(Config config);

    void on_audio_changed();

    void shutdown();

    bool endpoint_running() const { return server_ && server_->is_running(); }
    int endpoint_port() const { return server_ ? server_->port() : 0; }
    const Config& config() const { return config_; }

private:
    void build_services();
    void teardown_services();
    void open_history();
    void start_endpoint();
    void apply_level_monitor();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    AudioMixer& mixer_;
    LevelMonitor* level_monitor_;
    const PortProbe* port_probe_;
    NotifyCallback notify_;

    RequestLog request_log_;
    EventChannel events_;

    std::unique_ptr<AudioController> audio_;
    AudioController::SubscriptionId subscription_ = 0;
    std::unique_ptr<BridgeCorrelator> correlator_;
    std::unique_ptr<ControlService> service_;
    std::unique_ptr<HttpServer> server_;

    std::atomic<bool> input_changed_{false};
    std::atomic<bool> output_changed_{false};
};
