#pragma once

#include "platform/level_monitor.hpp"

#include <atomic>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Capture stream on the default source that only meters the signal.
class PipeWireLevelMonitor : public LevelMonitor {
public:
    PipeWireLevelMonitor();
    ~PipeWireLevelMonitor() override;

    PipeWireLevelMonitor(const PipeWireLevelMonitor&) = delete;
    PipeWireLevelMonitor& operator=(const PipeWireLevelMonitor&) = delete;

    bool start() override;
    void stop() override;
    bool is_running() const override { return running_.load(std::memory_order_relaxed); }
    float level() const override { return level_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    std::atomic<bool> running_{false};
    std::atomic<float> level_{0.0f};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
