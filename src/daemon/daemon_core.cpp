#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <fmt/core.h>

DaemonCore::DaemonCore(Config config, bool verbose, AudioMixer& mixer,
                       LevelMonitor* level_monitor, const PortProbe* port_probe,
                       NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      mixer_(mixer), level_monitor_(level_monitor), port_probe_(port_probe),
      notify_(std::move(notify)) {}

DaemonCore::~DaemonCore() {
    shutdown();
}

void DaemonCore::init() {
    open_history();
    apply_level_monitor();
    build_services();
    start_endpoint();
}

void DaemonCore::reload(Config config) {
    log("Reloading configuration");
    teardown_services();
    config_ = std::move(config);

    request_log_.close();
    open_history();
    apply_level_monitor();
    build_services();
    start_endpoint();
}

void DaemonCore::on_audio_changed() {
    bool input = input_changed_.exchange(false);
    bool output = output_changed_.exchange(false);
    if (!verbose_ || !audio_) return;

    if (input) {
        auto muted = audio_->mic_muted();
        auto device = audio_->input_device_name();
        log(fmt::format("Input changed: {} ({})",
                        muted ? (*muted ? "muted" : "live") : "unavailable",
                        device ? *device : "no device"));
    }
    if (output) {
        auto volume = audio_->output_volume();
        if (volume) {
            log(fmt::format("Output volume {:.2f}", *volume));
        } else {
            log("Output unavailable: " + volume.error().message);
        }
    }
}

void DaemonCore::shutdown() {
    teardown_services();
    if (level_monitor_) level_monitor_->stop();
    request_log_.close();
}

void DaemonCore::build_services() {
    AudioController::Options audio_opts{
        .mute_mode = config_.audio.mute_mode,
        .volume_step = config_.audio.volume_step,
        .unmute_volume = config_.audio.unmute_volume,
        .null_device = config_.audio.null_device,
    };
    audio_ = std::make_unique<AudioController>(mixer_, std::move(audio_opts));
    subscription_ = audio_->subscribe([this](AudioDirection dir) {
        (dir == AudioDirection::Input ? input_changed_ : output_changed_).store(true);
        if (notify_) notify_();
    });

    auto policy = config_.bridge.busy_policy == Config::BusyPolicy::Supersede
                      ? BridgeCorrelator::Policy::Supersede
                      : BridgeCorrelator::Policy::Reject;
    correlator_ = std::make_unique<BridgeCorrelator>(
        policy, std::chrono::milliseconds(config_.bridge.timeout_ms));

    ControlService::Options service_opts{
        .bridge_mode = config_.bridge.enabled,
        .poll_timeout = std::chrono::milliseconds(config_.bridge.poll_timeout_ms),
        .port = config_.server.port,
    };
    service_ = std::make_unique<ControlService>(
        *audio_, *correlator_, events_,
        request_log_.is_open() ? &request_log_ : nullptr,
        level_monitor_, service_opts, verbose_);
}

void DaemonCore::teardown_services() {
    if (server_) {
        server_->stop();
        server_.reset();
    }
    service_.reset();
    correlator_.reset();
    if (audio_) {
        audio_->unsubscribe(subscription_);
        audio_.reset();
    }
}

void DaemonCore::open_history() {
    if (!config_.history.enabled) {
        log("Request history disabled");
        return;
    }

    auto data = platform::data_dir();
    std::string db_path = data.empty() ? "/tmp/micdrop/history.db" : data + "/history.db";
    if (!request_log_.open(db_path, config_.history.max_entries)) {
        fmt::print(stderr, "[micdrop] Warning: history DB failed to open, history disabled\n");
    }
}

void DaemonCore::apply_level_monitor() {
    if (!level_monitor_) return;

    if (!config_.audio.monitor_input_level) {
        level_monitor_->stop();
        return;
    }
    if (!level_monitor_->start()) {
        fmt::print(stderr, "[micdrop] Warning: input level monitoring unavailable\n");
    }
}

void DaemonCore::start_endpoint() {
    if (!config_.server.enabled) {
        log("HTTP endpoint disabled");
        return;
    }

    HttpServer::Options opts{
        .bind_address = config_.server.bind_address,
        .port = config_.server.port,
        .cors = config_.server.cors,
    };
    server_ = std::make_unique<HttpServer>(*service_, std::move(opts), port_probe_, verbose_);

    auto started = server_->start();
    if (!started) {
        fmt::print(stderr, "[micdrop] http: {}, endpoint stays stopped\n", started.error().message);
        server_.reset();
        return;
    }

    log(fmt::format("Mode: {}", config_.bridge.enabled
                                    ? "bridge"
                                    : std::string(to_string(config_.audio.mute_mode))));
    log(fmt::format("Shortcut URL: http://{}:{}/toggle-mic",
                    platform::local_ipv4(), server_->port()));
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        fmt::print(stderr, "[micdrop] {}\n", msg);
    }
}
