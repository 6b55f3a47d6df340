#pragma once

#include "audio_error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

enum class AudioDirection { Input, Output };

struct AudioDevice {
    uint32_t id = 0;
    std::string name;        // stable node name, used to switch devices
    std::string description; // human-readable
    AudioDirection direction = AudioDirection::Output;
};

// Raw per-direction primitives of the audio server. Volumes are in [0,1] on
// the user-facing scale. Implementations are called from several threads.
class AudioMixer {
public:
    using ChangeCallback = std::function<void(AudioDirection)>;

    virtual ~AudioMixer() = default;

    virtual std::expected<float, AudioError> volume(AudioDirection dir) = 0;
    virtual std::expected<void, AudioError> set_volume(AudioDirection dir, float volume) = 0;

    // Unsupported when the default device has no settable mute flag.
    virtual std::expected<bool, AudioError> muted(AudioDirection dir) = 0;
    virtual std::expected<void, AudioError> set_muted(AudioDirection dir, bool muted) = 0;

    virtual std::expected<AudioDevice, AudioError> default_device(AudioDirection dir) = 0;
    virtual std::expected<void, AudioError> set_default_device(AudioDirection dir,
                                                               const std::string& name) = 0;
    virtual std::vector<AudioDevice> devices(AudioDirection dir) = 0;

    // Invoked from the mixer's own thread whenever volume, mute or the default
    // device of a direction changes.
    virtual void set_change_callback(ChangeCallback cb) = 0;
};
