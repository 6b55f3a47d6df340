#pragma once

#include "platform/audio_mixer.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <pipewire/extensions/metadata.h>
#include <pipewire/pipewire.h>
#include <string>
#include <vector>

// AudioMixer over the PipeWire registry. Audio/Sink and Audio/Source nodes
// are bound and their Props params cached; defaults come from the "default"
// metadata object. Volumes are exposed on the cubic scale used by pavucontrol.
class PipeWireMixer : public AudioMixer {
public:
    PipeWireMixer();
    ~PipeWireMixer() override;

    PipeWireMixer(const PipeWireMixer&) = delete;
    PipeWireMixer& operator=(const PipeWireMixer&) = delete;

    std::expected<void, AudioError> connect();
    void disconnect();
    bool is_connected() const { return connected_.load(std::memory_order_acquire); }

    std::expected<float, AudioError> volume(AudioDirection dir) override;
    std::expected<void, AudioError> set_volume(AudioDirection dir, float volume) override;
    std::expected<bool, AudioError> muted(AudioDirection dir) override;
    std::expected<void, AudioError> set_muted(AudioDirection dir, bool muted) override;
    std::expected<AudioDevice, AudioError> default_device(AudioDirection dir) override;
    std::expected<void, AudioError> set_default_device(AudioDirection dir,
                                                       const std::string& name) override;
    std::vector<AudioDevice> devices(AudioDirection dir) override;
    void set_change_callback(ChangeCallback cb) override;

private:
    struct Node {
        PipeWireMixer* owner = nullptr;
        uint32_t id = 0;
        std::string name;
        std::string description;
        AudioDirection direction = AudioDirection::Output;
        pw_node* proxy = nullptr;
        spa_hook listener{};

        std::vector<float> channel_volumes; // linear
        bool has_mute = false;
        bool mute = false;
    };

    // Must be called with the thread loop locked.
    Node* find_default(AudioDirection dir);
    Node* find_by_name(AudioDirection dir, const std::string& name);
    bool roundtrip();
    // Stops the loop, then destroys proxies, core, context and loop.
    void teardown();
    void notify(AudioDirection dir);

    static void on_core_done(void* data, uint32_t id, int seq);
    static void on_core_error(void* data, uint32_t id, int seq, int res, const char* message);
    static void on_global(void* data, uint32_t id, uint32_t permissions, const char* type,
                          uint32_t version, const spa_dict* props);
    static void on_global_remove(void* data, uint32_t id);
    static void on_node_param(void* data, int seq, uint32_t id, uint32_t index, uint32_t next,
                              const spa_pod* param);
    static int on_metadata_property(void* data, uint32_t subject, const char* key,
                                    const char* type, const char* value);

    std::atomic<bool> connected_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    pw_metadata* metadata_ = nullptr;
    uint32_t metadata_id_ = 0;
    spa_hook core_listener_{};
    spa_hook registry_listener_{};
    spa_hook metadata_listener_{};

    int pending_seq_ = 0;
    bool sync_done_ = false;
    bool core_failed_ = false;

    std::map<uint32_t, std::unique_ptr<Node>> nodes_;
    std::string default_sink_;
    std::string default_source_;

    std::mutex callback_mutex_;
    ChangeCallback callback_;

    static constexpr pw_core_events core_events_ = {
        .version = PW_VERSION_CORE_EVENTS,
        .done = on_core_done,
        .error = on_core_error,
    };

    static constexpr pw_registry_events registry_events_ = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_global,
        .global_remove = on_global_remove,
    };

    static constexpr pw_node_events node_events_ = {
        .version = PW_VERSION_NODE_EVENTS,
        .param = on_node_param,
    };

    static constexpr pw_metadata_events metadata_events_ = {
        .version = PW_VERSION_METADATA_EVENTS,
        .property = on_metadata_property,
    };
};
