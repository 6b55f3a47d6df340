#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/pipewire_level_monitor.hpp"
#include "platform/linux/pipewire_mixer.hpp"
#include "platform/linux/procfs_port_probe.hpp"

#include <atomic>
#include <functional>

class LinuxEventLoop {
public:
    // Produces the effective configuration; called at start and on SIGHUP.
    using ConfigLoader = std::function<Config()>;

    explicit LinuxEventLoop(ConfigLoader loader, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void log(const std::string& msg);

    ConfigLoader loader_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    PipeWireMixer mixer_;
    PipeWireLevelMonitor level_monitor_;
    ProcfsPortProbe port_probe_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int audio_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
