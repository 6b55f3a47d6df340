#include "platform/linux/pipewire_level_monitor.hpp"

#include "level_meter.hpp"

#include <fmt/core.h>
#include <span>
#include <spa/utils/result.h>

PipeWireLevelMonitor::PipeWireLevelMonitor() {
    pw_init(nullptr, nullptr);
}

PipeWireLevelMonitor::~PipeWireLevelMonitor() {
    stop();
    pw_deinit();
}

bool PipeWireLevelMonitor::start() {
    if (running_.load(std::memory_order_relaxed)) return true;

    loop_ = pw_thread_loop_new("micdrop-level", nullptr);
    if (!loop_) {
        fmt::print(stderr, "audio: failed to create level thread loop\n");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "micdrop-level",
        PW_KEY_APP_NAME, "micdrop",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "micdrop-level",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        fmt::print(stderr, "audio: failed to create level stream\n");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    // F32 mono, rate left to the graph
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        fmt::print(stderr, "audio: level stream connect failed: {}\n", spa_strerror(ret));
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        fmt::print(stderr, "audio: level thread loop start failed: {}\n", spa_strerror(ret));
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    level_.store(0.0f, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);
    return true;
}

void PipeWireLevelMonitor::stop() {
    if (!running_.load(std::memory_order_relaxed)) return;

    running_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    level_.store(0.0f, std::memory_order_relaxed);
}

void PipeWireLevelMonitor::on_process(void* userdata) {
    auto* self = static_cast<PipeWireLevelMonitor*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* samples = reinterpret_cast<const float*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(float);

    if (count > 0) {
        float rms = level_meter::rms(std::span<const float>(samples, count));
        self->level_.store(level_meter::normalize(rms), std::memory_order_relaxed);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireLevelMonitor::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                            enum pw_stream_state state, const char* error) {
    if (error) {
        fmt::print(stderr, "audio: level stream state {} -> {}: {}\n",
                   pw_stream_state_as_string(old),
                   pw_stream_state_as_string(state),
                   error);
    }
}
