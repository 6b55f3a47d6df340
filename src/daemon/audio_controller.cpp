#include "audio_controller.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/core.h>

namespace {

constexpr float VOLUME_EPSILON = 0.001f;

float clamp_volume(float v) {
    if (std::isnan(v)) return 0.0f;
    return std::clamp(v, 0.0f, 1.0f);
}

} // namespace

AudioController::AudioController(AudioMixer& mixer, Options options)
    : mixer_(mixer), options_(std::move(options)),
      restore_volume_(options_.unmute_volume) {
    mixer_.set_change_callback([this](AudioDirection dir) { notify(dir); });
}

AudioController::~AudioController() {
    mixer_.set_change_callback(nullptr);
}

std::expected<float, AudioError> AudioController::output_volume() {
    return mixer_.volume(AudioDirection::Output);
}

std::expected<float, AudioError> AudioController::set_output_volume(float volume) {
    std::lock_guard lock(op_mutex_);
    return apply_output_volume(volume);
}

std::expected<float, AudioError> AudioController::increase_output_volume() {
    std::lock_guard lock(op_mutex_);
    auto current = mixer_.volume(AudioDirection::Output);
    if (!current) return current;
    return apply_output_volume(*current + options_.volume_step);
}

std::expected<float, AudioError> AudioController::decrease_output_volume() {
    std::lock_guard lock(op_mutex_);
    auto current = mixer_.volume(AudioDirection::Output);
    if (!current) return current;
    return apply_output_volume(*current - options_.volume_step);
}

std::expected<float, AudioError> AudioController::apply_output_volume(float volume) {
    float target = clamp_volume(volume);
    auto current = mixer_.volume(AudioDirection::Output);
    if (!current) return std::unexpected(current.error());

    if (std::fabs(*current - target) < VOLUME_EPSILON) {
        return *current;
    }

    auto res = mixer_.set_volume(AudioDirection::Output, target);
    if (!res) return std::unexpected(res.error());
    return target;
}

std::expected<bool, AudioError> AudioController::toggle_output_mute() {
    std::lock_guard lock(op_mutex_);

    auto current = mixer_.volume(AudioDirection::Output);
    if (!current) return std::unexpected(current.error());

    if (*current > 0.0f) {
        auto res = mixer_.set_volume(AudioDirection::Output, 0.0f);
        if (!res) return std::unexpected(res.error());
        restore_volume_ = *current;
        return true;
    }

    float target = restore_volume_ > 0.0f ? restore_volume_ : options_.unmute_volume;
    auto res = mixer_.set_volume(AudioDirection::Output, target);
    if (!res) return std::unexpected(res.error());
    return false;
}

std::expected<bool, AudioError> AudioController::output_muted() {
    auto v = mixer_.volume(AudioDirection::Output);
    if (!v) return std::unexpected(v.error());
    return *v <= 0.0f;
}

std::expected<bool, AudioError> AudioController::mic_muted() {
    switch (options_.mute_mode) {
        case MuteMode::HardwareMute: {
            auto m = mixer_.muted(AudioDirection::Input);
            if (m || m.error().kind != AudioError::Kind::Unsupported) return m;
            // No hardware flag: the toggle fell back to volume mode.
            auto v = mixer_.volume(AudioDirection::Input);
            if (!v) return std::unexpected(v.error());
            return *v <= 0.0f;
        }
        case MuteMode::VolumeZero: {
            auto v = mixer_.volume(AudioDirection::Input);
            if (!v) return std::unexpected(v.error());
            return *v <= 0.0f;
        }
        case MuteMode::DeviceSwitch: {
            auto dev = mixer_.default_device(AudioDirection::Input);
            if (!dev) return std::unexpected(dev.error());
            if (!options_.null_device.empty() && dev->name == options_.null_device) return true;
            auto v = mixer_.volume(AudioDirection::Input);
            if (!v) return std::unexpected(v.error());
            return *v <= 0.0f;
        }
    }
    return false;
}

std::expected<bool, AudioError> AudioController::toggle_mic() {
    std::lock_guard lock(op_mutex_);

    switch (options_.mute_mode) {
        case MuteMode::HardwareMute: return toggle_via_hardware_mute();
        case MuteMode::VolumeZero: return toggle_via_volume();
        case MuteMode::DeviceSwitch: return toggle_via_device_switch();
    }
    return toggle_via_hardware_mute();
}

std::expected<std::string, AudioError> AudioController::input_device_name() {
    auto dev = mixer_.default_device(AudioDirection::Input);
    if (!dev) return std::unexpected(dev.error());
    return dev->description.empty() ? dev->name : dev->description;
}

std::expected<bool, AudioError> AudioController::toggle_via_hardware_mute() {
    auto current = mixer_.muted(AudioDirection::Input);
    if (!current) {
        if (current.error().kind == AudioError::Kind::Unsupported) {
            fmt::print(stderr, "audio: hardware mute not supported, falling back to volume mode\n");
            return toggle_via_volume();
        }
        return std::unexpected(current.error());
    }

    bool target = !*current;
    auto res = mixer_.set_muted(AudioDirection::Input, target);
    if (!res) {
        if (res.error().kind == AudioError::Kind::Unsupported) {
            fmt::print(stderr, "audio: hardware mute not settable, falling back to volume mode\n");
            return toggle_via_volume();
        }
        return std::unexpected(res.error());
    }
    return target;
}

std::expected<bool, AudioError> AudioController::toggle_via_volume() {
    auto volume = mixer_.volume(AudioDirection::Input);
    if (!volume) return std::unexpected(volume.error());

    float target = *volume <= 0.0f ? 1.0f : 0.0f;
    auto res = mixer_.set_volume(AudioDirection::Input, target);
    if (!res) return std::unexpected(res.error());
    return target == 0.0f;
}

std::expected<bool, AudioError> AudioController::toggle_via_device_switch() {
    auto current = mixer_.default_device(AudioDirection::Input);
    if (!current) return std::unexpected(current.error());

    bool muted = !options_.null_device.empty() && current->name == options_.null_device;

    if (muted) {
        if (!real_mic_) {
            fmt::print(stderr, "audio: real microphone unknown, falling back to volume mode\n");
            return toggle_via_volume();
        }
        auto res = mixer_.set_default_device(AudioDirection::Input, *real_mic_);
        if (!res) {
            if (res.error().kind == AudioError::Kind::NoDevice) {
                fmt::print(stderr, "audio: real microphone {} not found, falling back to volume mode\n",
                           *real_mic_);
                return toggle_via_volume();
            }
            return std::unexpected(res.error());
        }
        return false;
    }

    if (options_.null_device.empty()) {
        fmt::print(stderr, "audio: null device not configured, falling back to volume mode\n");
        return toggle_via_volume();
    }

    auto res = mixer_.set_default_device(AudioDirection::Input, options_.null_device);
    if (!res) {
        if (res.error().kind == AudioError::Kind::NoDevice) {
            fmt::print(stderr, "audio: null device {} not found, falling back to volume mode\n",
                       options_.null_device);
            return toggle_via_volume();
        }
        return std::unexpected(res.error());
    }
    real_mic_ = current->name;
    return true;
}

AudioController::SubscriptionId AudioController::subscribe(Observer observer) {
    std::lock_guard lock(observers_mutex_);
    auto id = next_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}

void AudioController::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(observers_mutex_);
    std::erase_if(observers_, [id](const auto& entry) { return entry.first == id; });
}

void AudioController::notify(AudioDirection dir) {
    std::vector<Observer> targets;
    {
        std::lock_guard lock(observers_mutex_);
        for (auto& [id, obs] : observers_) targets.push_back(obs);
    }
    for (auto& obs : targets) {
        if (obs) obs(dir);
    }
}
