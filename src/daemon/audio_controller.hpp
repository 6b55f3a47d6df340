#pragma once

#include "audio_error.hpp"
#include "mute_mode.hpp"
#include "platform/audio_mixer.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class AudioController {
public:
    struct Options {
        MuteMode mute_mode = MuteMode::HardwareMute;
        float volume_step = 0.1f;
        float unmute_volume = 0.5f;
        std::string null_device;
    };

    using Observer = std::function<void(AudioDirection)>;
    using SubscriptionId = uint64_t;

    AudioController(AudioMixer& mixer, Options options);
    ~AudioController();

    AudioController(const AudioController&) = delete;
    AudioController& operator=(const AudioController&) = delete;

    // Output (speaker) volume
    std::expected<float, AudioError> output_volume();
    // Clamps to [0,1]. Returns the volume now in effect.
    std::expected<float, AudioError> set_output_volume(float volume);
    std::expected<float, AudioError> increase_output_volume();
    std::expected<float, AudioError> decrease_output_volume();
    // Returns the new muted state.
    std::expected<bool, AudioError> toggle_output_mute();
    std::expected<bool, AudioError> output_muted();

    // Microphone
    std::expected<bool, AudioError> mic_muted();
    // Returns the new muted state.
    std::expected<bool, AudioError> toggle_mic();
    std::expected<std::string, AudioError> input_device_name();

    MuteMode mute_mode() const { return options_.mute_mode; }

    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

private:
    std::expected<float, AudioError> apply_output_volume(float volume);
    std::expected<bool, AudioError> toggle_via_hardware_mute();
    std::expected<bool, AudioError> toggle_via_volume();
    std::expected<bool, AudioError> toggle_via_device_switch();

    void notify(AudioDirection dir);

    AudioMixer& mixer_;
    Options options_;

    // Serializes read-modify-write sequences (toggle, step).
    std::mutex op_mutex_;
    float restore_volume_;
    std::optional<std::string> real_mic_;

    std::mutex observers_mutex_;
    std::vector<std::pair<SubscriptionId, Observer>> observers_;
    SubscriptionId next_id_ = 1;
};
