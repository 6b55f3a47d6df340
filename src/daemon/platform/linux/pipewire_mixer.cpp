#include "platform/linux/pipewire_mixer.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spa/param/audio/raw.h>
#include <spa/param/props.h>
#include <spa/pod/builder.h>
#include <spa/pod/iter.h>
#include <spa/utils/result.h>

namespace {

constexpr int SYNC_TIMEOUT_S = 2;

constexpr const char* DEFAULT_SINK_KEY = "default.audio.sink";
constexpr const char* DEFAULT_SOURCE_KEY = "default.audio.source";
constexpr const char* CONFIGURED_SINK_KEY = "default.configured.audio.sink";
constexpr const char* CONFIGURED_SOURCE_KEY = "default.configured.audio.source";

class LoopLock {
public:
    explicit LoopLock(pw_thread_loop* loop) : loop_(loop) { pw_thread_loop_lock(loop_); }
    ~LoopLock() { pw_thread_loop_unlock(loop_); }

    LoopLock(const LoopLock&) = delete;
    LoopLock& operator=(const LoopLock&) = delete;

private:
    pw_thread_loop* loop_;
};

// Metadata values look like {"name":"alsa_output.pci-0000_00_1f.3.analog-stereo"}.
std::string parse_default_name(const char* value) {
    if (!value) return {};
    auto j = nlohmann::json::parse(value, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return {};
    auto it = j.find("name");
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

const char* dict_get(const spa_dict* props, const char* key) {
    return props ? spa_dict_lookup(props, key) : nullptr;
}

AudioError not_connected() {
    return AudioError::backend("not connected to PipeWire");
}

} // namespace

PipeWireMixer::PipeWireMixer() {
    pw_init(nullptr, nullptr);
}

PipeWireMixer::~PipeWireMixer() {
    disconnect();
    pw_deinit();
}

std::expected<void, AudioError> PipeWireMixer::connect() {
    if (connected_.load(std::memory_order_acquire)) return {};

    loop_ = pw_thread_loop_new("micdrop-mixer", nullptr);
    if (!loop_) {
        return std::unexpected(AudioError::backend("failed to create thread loop"));
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (!context_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(AudioError::backend("failed to create context"));
    }

    int ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        teardown();
        return std::unexpected(AudioError::backend(
            fmt::format("thread loop start failed: {}", spa_strerror(ret))));
    }

    std::string error;
    {
        LoopLock lock(loop_);

        auto* props = pw_properties_new(PW_KEY_APP_NAME, "micdrop", nullptr);
        core_ = pw_context_connect(context_, props, 0);
        if (!core_) {
            error = fmt::format("cannot connect to PipeWire: {}", std::strerror(errno));
        } else {
            pw_core_add_listener(core_, &core_listener_, &core_events_, this);

            registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
            pw_registry_add_listener(registry_, &registry_listener_, &registry_events_, this);

            // First pass announces globals, second delivers the params and
            // metadata properties of what was bound.
            if (!roundtrip() || !roundtrip()) {
                error = "PipeWire did not answer the sync";
            }
        }
    }

    if (!error.empty()) {
        teardown();
        return std::unexpected(AudioError::backend(error));
    }

    connected_.store(true, std::memory_order_release);
    return {};
}

void PipeWireMixer::disconnect() {
    connected_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireMixer::teardown() {
    if (!loop_) return;

    pw_thread_loop_stop(loop_);

    for (auto& [id, node] : nodes_) {
        spa_hook_remove(&node->listener);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(node->proxy));
    }
    nodes_.clear();

    if (metadata_) {
        spa_hook_remove(&metadata_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(metadata_));
        metadata_ = nullptr;
    }
    if (registry_) {
        spa_hook_remove(&registry_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
        registry_ = nullptr;
    }
    if (core_) {
        spa_hook_remove(&core_listener_);
        pw_core_disconnect(core_);
        core_ = nullptr;
    }
    if (context_) {
        pw_context_destroy(context_);
        context_ = nullptr;
    }
    pw_thread_loop_destroy(loop_);
    loop_ = nullptr;

    default_sink_.clear();
    default_source_.clear();
}

bool PipeWireMixer::roundtrip() {
    sync_done_ = false;
    core_failed_ = false;
    pending_seq_ = pw_core_sync(core_, PW_ID_CORE, pending_seq_);
    while (!sync_done_) {
        if (pw_thread_loop_timed_wait(loop_, SYNC_TIMEOUT_S) != 0) return false;
    }
    return !core_failed_;
}

std::expected<float, AudioError> PipeWireMixer::volume(AudioDirection dir) {
    if (!is_connected()) return std::unexpected(not_connected());
    LoopLock lock(loop_);

    auto* node = find_default(dir);
    if (!node) return std::unexpected(AudioError::no_device("no default device"));
    if (node->channel_volumes.empty()) {
        return std::unexpected(AudioError::unsupported(node->name + " has no volume control"));
    }

    float sum = 0.0f;
    for (float v : node->channel_volumes) sum += v;
    float linear = sum / static_cast<float>(node->channel_volumes.size());
    return std::clamp(std::cbrt(linear), 0.0f, 1.0f);
}

std::expected<void, AudioError> PipeWireMixer::set_volume(AudioDirection dir, float volume) {
    if (!is_connected()) return std::unexpected(not_connected());
    LoopLock lock(loop_);

    auto* node = find_default(dir);
    if (!node) return std::unexpected(AudioError::no_device("no default device"));
    if (node->channel_volumes.empty()) {
        return std::unexpected(AudioError::unsupported(node->name + " has no volume control"));
    }

    float linear = volume * volume * volume;
    std::vector<float> volumes(node->channel_volumes.size(), linear);

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    spa_pod_frame f;
    spa_pod_builder_push_object(&b, &f, SPA_TYPE_OBJECT_Props, SPA_PARAM_Props);
    spa_pod_builder_prop(&b, SPA_PROP_channelVolumes, 0);
    spa_pod_builder_array(&b, sizeof(float), SPA_TYPE_Float,
                          static_cast<uint32_t>(volumes.size()), volumes.data());
    auto* param = static_cast<const spa_pod*>(spa_pod_builder_pop(&b, &f));

    int ret = pw_node_set_param(node->proxy, SPA_PARAM_Props, 0, param);
    if (ret < 0) {
        return std::unexpected(AudioError::backend(
            fmt::format("set volume on {} failed: {}", node->name, spa_strerror(ret))));
    }

    // The param event confirming this arrives later; reads see it now.
    node->channel_volumes = std::move(volumes);
    return {};
}

std::expected<bool, AudioError> PipeWireMixer::muted(AudioDirection dir) {
    if (!is_connected()) return std::unexpected(not_connected());
    LoopLock lock(loop_);

    auto* node = find_default(dir);
    if (!node) return std::unexpected(AudioError::no_device("no default device"));
    if (!node->has_mute) {
        return std::unexpected(AudioError::unsupported(node->name + " has no mute control"));
    }
    return node->mute;
}

std::expected<void, AudioError> PipeWireMixer::set_muted(AudioDirection dir, bool muted) {
    if (!is_connected()) return std::unexpected(not_connected());
    LoopLock lock(loop_);

    auto* node = find_default(dir);
    if (!node) return std::unexpected(AudioError::no_device("no default device"));
    if (!node->has_mute) {
        return std::unexpected(AudioError::unsupported(node->name + " has no mute control"));
    }

    uint8_t buf[256];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    spa_pod_frame f;
    spa_pod_builder_push_object(&b, &f, SPA_TYPE_OBJECT_Props, SPA_PARAM_Props);
    spa_pod_builder_prop(&b, SPA_PROP_mute, 0);
    spa_pod_builder_bool(&b, muted);
    auto* param = static_cast<const spa_pod*>(spa_pod_builder_pop(&b, &f));

    int ret = pw_node_set_param(node->proxy, SPA_PARAM_Props, 0, param);
    if (ret < 0) {
        return std::unexpected(AudioError::backend(
            fmt::format("set mute on {} failed: {}", node->name, spa_strerror(ret))));
    }

    node->mute = muted;
    return {};
}

std::expected<AudioDevice, AudioError> PipeWireMixer::default_device(AudioDirection dir) {
    if (!is_connected()) return std::unexpected(not_connected());
    LoopLock lock(loop_);

    auto* node = find_default(dir);
    if (!node) return std::unexpected(AudioError::no_device("no default device"));
    return AudioDevice{node->id, node->name, node->description, node->direction};
}

std::expected<void, AudioError> PipeWireMixer::set_default_device(AudioDirection dir,
                                                                  const std::string& name) {
    if (!is_connected()) return std::unexpected(not_connected());
    LoopLock lock(loop_);

    if (!find_by_name(dir, name)) {
        return std::unexpected(AudioError::no_device("device " + name + " not found"));
    }
    if (!metadata_) {
        return std::unexpected(AudioError::unsupported("no default metadata object"));
    }

    const char* key = dir == AudioDirection::Output ? CONFIGURED_SINK_KEY : CONFIGURED_SOURCE_KEY;
    std::string value = nlohmann::json{{"name", name}}.dump();
    int ret = pw_metadata_set_property(metadata_, PW_ID_CORE, key, "Spa:String:JSON", value.c_str());
    if (ret < 0) {
        return std::unexpected(AudioError::backend(
            fmt::format("set default device failed: {}", spa_strerror(ret))));
    }

    // The session manager answers with default.audio.*; reads see it now.
    (dir == AudioDirection::Output ? default_sink_ : default_source_) = name;
    return {};
}

std::vector<AudioDevice> PipeWireMixer::devices(AudioDirection dir) {
    std::vector<AudioDevice> result;
    if (!is_connected()) return result;
    LoopLock lock(loop_);

    for (auto& [id, node] : nodes_) {
        if (node->direction == dir) {
            result.push_back({node->id, node->name, node->description, node->direction});
        }
    }
    return result;
}

void PipeWireMixer::set_change_callback(ChangeCallback cb) {
    std::lock_guard lock(callback_mutex_);
    callback_ = std::move(cb);
}

PipeWireMixer::Node* PipeWireMixer::find_default(AudioDirection dir) {
    const auto& name = dir == AudioDirection::Output ? default_sink_ : default_source_;
    if (name.empty()) return nullptr;
    return find_by_name(dir, name);
}

PipeWireMixer::Node* PipeWireMixer::find_by_name(AudioDirection dir, const std::string& name) {
    for (auto& [id, node] : nodes_) {
        if (node->direction == dir && node->name == name) return node.get();
    }
    return nullptr;
}

void PipeWireMixer::notify(AudioDirection dir) {
    std::lock_guard lock(callback_mutex_);
    if (callback_) callback_(dir);
}

void PipeWireMixer::on_core_done(void* data, uint32_t id, int seq) {
    auto* self = static_cast<PipeWireMixer*>(data);
    if (id == PW_ID_CORE && seq == self->pending_seq_) {
        self->sync_done_ = true;
        pw_thread_loop_signal(self->loop_, false);
    }
}

void PipeWireMixer::on_core_error(void* data, uint32_t id, int seq, int res, const char* message) {
    auto* self = static_cast<PipeWireMixer*>(data);
    fmt::print(stderr, "audio: PipeWire error on {} (seq {}): {} ({})\n",
               id, seq, message ? message : "", spa_strerror(res));
    if (id == PW_ID_CORE && res == -EPIPE) {
        self->connected_.store(false, std::memory_order_release);
        self->core_failed_ = true;
        // Release anyone blocked in a roundtrip.
        self->sync_done_ = true;
        pw_thread_loop_signal(self->loop_, false);
    }
}

void PipeWireMixer::on_global(void* data, uint32_t id, uint32_t /*permissions*/,
                              const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* self = static_cast<PipeWireMixer*>(data);

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) == 0) {
        const char* media_class = dict_get(props, PW_KEY_MEDIA_CLASS);
        if (!media_class) return;

        AudioDirection dir;
        if (std::strcmp(media_class, "Audio/Sink") == 0) {
            dir = AudioDirection::Output;
        } else if (std::strcmp(media_class, "Audio/Source") == 0) {
            dir = AudioDirection::Input;
        } else {
            return;
        }

        auto node = std::make_unique<Node>();
        node->owner = self;
        node->id = id;
        node->direction = dir;
        if (const char* name = dict_get(props, PW_KEY_NODE_NAME)) node->name = name;
        if (const char* desc = dict_get(props, PW_KEY_NODE_DESCRIPTION)) node->description = desc;

        node->proxy = static_cast<pw_node*>(
            pw_registry_bind(self->registry_, id, type, PW_VERSION_NODE, 0));
        if (!node->proxy) {
            fmt::print(stderr, "audio: cannot bind node {}\n", node->name);
            return;
        }
        pw_node_add_listener(node->proxy, &node->listener, &node_events_, node.get());

        uint32_t ids[] = {SPA_PARAM_Props};
        pw_node_subscribe_params(node->proxy, ids, 1);

        self->nodes_[id] = std::move(node);
        self->notify(dir);
        return;
    }

    if (std::strcmp(type, PW_TYPE_INTERFACE_Metadata) == 0) {
        const char* name = dict_get(props, PW_KEY_METADATA_NAME);
        if (!name || std::strcmp(name, "default") != 0 || self->metadata_) return;

        self->metadata_ = static_cast<pw_metadata*>(
            pw_registry_bind(self->registry_, id, type, PW_VERSION_METADATA, 0));
        if (!self->metadata_) {
            fmt::print(stderr, "audio: cannot bind default metadata\n");
            return;
        }
        self->metadata_id_ = id;
        pw_metadata_add_listener(self->metadata_, &self->metadata_listener_,
                                 &metadata_events_, self);
    }
}

void PipeWireMixer::on_global_remove(void* data, uint32_t id) {
    auto* self = static_cast<PipeWireMixer*>(data);

    if (auto it = self->nodes_.find(id); it != self->nodes_.end()) {
        auto dir = it->second->direction;
        spa_hook_remove(&it->second->listener);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(it->second->proxy));
        self->nodes_.erase(it);
        self->notify(dir);
        return;
    }

    if (self->metadata_ && id == self->metadata_id_) {
        spa_hook_remove(&self->metadata_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(self->metadata_));
        self->metadata_ = nullptr;
    }
}

void PipeWireMixer::on_node_param(void* data, int /*seq*/, uint32_t id, uint32_t /*index*/,
                                  uint32_t /*next*/, const spa_pod* param) {
    auto* node = static_cast<Node*>(data);
    if (id != SPA_PARAM_Props || !param || !spa_pod_is_object(param)) return;

    bool changed = false;
    const auto* obj = reinterpret_cast<const spa_pod_object*>(param);
    const spa_pod_prop* prop;
    SPA_POD_OBJECT_FOREACH(obj, prop) {
        switch (prop->key) {
            case SPA_PROP_mute: {
                bool mute = false;
                if (spa_pod_get_bool(&prop->value, &mute) == 0) {
                    changed |= !node->has_mute || node->mute != mute;
                    node->has_mute = true;
                    node->mute = mute;
                }
                break;
            }
            case SPA_PROP_channelVolumes: {
                float volumes[SPA_AUDIO_MAX_CHANNELS];
                uint32_t n = spa_pod_copy_array(&prop->value, SPA_TYPE_Float,
                                                volumes, SPA_AUDIO_MAX_CHANNELS);
                if (n > 0) {
                    std::vector<float> next(volumes, volumes + n);
                    changed |= next != node->channel_volumes;
                    node->channel_volumes = std::move(next);
                }
                break;
            }
            default:
                break;
        }
    }

    if (changed) node->owner->notify(node->direction);
}

int PipeWireMixer::on_metadata_property(void* data, uint32_t subject, const char* key,
                                        const char* /*type*/, const char* value) {
    auto* self = static_cast<PipeWireMixer*>(data);
    if (subject != PW_ID_CORE) return 0;

    // A null key clears every property.
    if (!key) {
        self->default_sink_.clear();
        self->default_source_.clear();
        self->notify(AudioDirection::Output);
        self->notify(AudioDirection::Input);
        return 0;
    }

    if (std::strcmp(key, DEFAULT_SINK_KEY) == 0) {
        self->default_sink_ = parse_default_name(value);
        self->notify(AudioDirection::Output);
    } else if (std::strcmp(key, DEFAULT_SOURCE_KEY) == 0) {
        self->default_source_ = parse_default_name(value);
        self->notify(AudioDirection::Input);
    }
    return 0;
}
