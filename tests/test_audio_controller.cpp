#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "audio_controller.hpp"
#include "mock_audio_mixer.hpp"

using Catch::Approx;

TEST_CASE("AudioController output volume", "[audio]") {
    MockAudioMixer mixer;
    AudioController audio(mixer, {});

    SECTION("SetThenGetReturnsValue") {
        float v = GENERATE(0.0f, 0.05f, 0.3f, 0.5f, 0.75f, 1.0f);
        mixer.output.volume = v > 0.5f ? 0.1f : 0.9f;

        auto set = audio.set_output_volume(v);
        REQUIRE(set.has_value());
        REQUIRE(*set == Approx(v));

        auto got = audio.output_volume();
        REQUIRE(got.has_value());
        REQUIRE(*got == Approx(v));
    }

    SECTION("SetClampsToRange") {
        REQUIRE(*audio.set_output_volume(1.5f) == Approx(1.0f));
        REQUIRE(mixer.output.volume == Approx(1.0f));
        REQUIRE(*audio.set_output_volume(-0.2f) == Approx(0.0f));
        REQUIRE(mixer.output.volume == Approx(0.0f));
    }

    SECTION("SettingCurrentValueSkipsBackend") {
        mixer.output.volume = 0.4f;
        int calls = mixer.set_volume_calls;
        REQUIRE(*audio.set_output_volume(0.4f) == Approx(0.4f));
        REQUIRE(mixer.set_volume_calls == calls);
    }

    SECTION("IncreaseAndDecreaseByStep") {
        mixer.output.volume = 0.5f;
        REQUIRE(*audio.increase_output_volume() == Approx(0.6f));
        REQUIRE(*audio.decrease_output_volume() == Approx(0.5f));
        REQUIRE(*audio.decrease_output_volume() == Approx(0.4f));
    }

    SECTION("StepsClampAtEnds") {
        mixer.output.volume = 0.95f;
        REQUIRE(*audio.increase_output_volume() == Approx(1.0f));
        REQUIRE(*audio.increase_output_volume() == Approx(1.0f));

        mixer.output.volume = 0.05f;
        REQUIRE(*audio.decrease_output_volume() == Approx(0.0f));
        REQUIRE(*audio.decrease_output_volume() == Approx(0.0f));
    }

    SECTION("ToggleMuteRestoresPreviousVolume") {
        mixer.output.volume = 0.7f;

        auto muted = audio.toggle_output_mute();
        REQUIRE(muted.has_value());
        REQUIRE(*muted);
        REQUIRE(mixer.output.volume == Approx(0.0f));
        REQUIRE(*audio.output_muted());

        muted = audio.toggle_output_mute();
        REQUIRE_FALSE(*muted);
        REQUIRE(mixer.output.volume == Approx(0.7f));
    }

    SECTION("ToggleMuteFromSilenceUsesUnmuteVolume") {
        mixer.output.volume = 0.0f;
        auto muted = audio.toggle_output_mute();
        REQUIRE_FALSE(*muted);
        REQUIRE(mixer.output.volume == Approx(0.5f));
    }

    SECTION("BackendFailureLeavesStateUnchanged") {
        mixer.output.volume = 0.3f;
        mixer.backend_failure = true;

        auto res = audio.set_output_volume(0.8f);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == AudioError::Kind::Backend);

        mixer.backend_failure = false;
        REQUIRE(*audio.output_volume() == Approx(0.3f));
    }

    SECTION("NoDefaultDevice") {
        mixer.output.default_device.clear();
        auto res = audio.increase_output_volume();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == AudioError::Kind::NoDevice);
    }
}

TEST_CASE("AudioController microphone", "[audio]") {
    MockAudioMixer mixer;

    SECTION("HardwareToggleTwiceGivesOppositeStates") {
        AudioController audio(mixer, {.mute_mode = MuteMode::HardwareMute});

        auto first = audio.toggle_mic();
        auto second = audio.toggle_mic();
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(*first != *second);
        REQUIRE(*first);
        REQUIRE(mixer.input.muted == false);
    }

    SECTION("HardwareWithoutMuteFallsBackToVolume") {
        mixer.input.mute_supported = false;
        mixer.input.volume = 0.8f;
        AudioController audio(mixer, {.mute_mode = MuteMode::HardwareMute});

        REQUIRE(*audio.toggle_mic());
        REQUIRE(mixer.input.volume == Approx(0.0f));
        REQUIRE(*audio.mic_muted());

        REQUIRE_FALSE(*audio.toggle_mic());
        REQUIRE(mixer.input.volume == Approx(1.0f));
        REQUIRE_FALSE(*audio.mic_muted());
    }

    SECTION("VolumeModeTogglesBetweenZeroAndFull") {
        mixer.input.volume = 0.6f;
        AudioController audio(mixer, {.mute_mode = MuteMode::VolumeZero});

        REQUIRE_FALSE(*audio.mic_muted());
        REQUIRE(*audio.toggle_mic());
        REQUIRE(mixer.input.volume == Approx(0.0f));
        REQUIRE_FALSE(*audio.toggle_mic());
        REQUIRE(mixer.input.volume == Approx(1.0f));
    }

    SECTION("DeviceSwitchRestoresRealMic") {
        mixer.input.devices.push_back({3, "null-sink", "Null Input", AudioDirection::Input});
        AudioController audio(mixer, {.mute_mode = MuteMode::DeviceSwitch, .null_device = "null-sink"});

        REQUIRE(*audio.toggle_mic());
        REQUIRE(mixer.input.default_device == "null-sink");
        REQUIRE(*audio.mic_muted());

        REQUIRE_FALSE(*audio.toggle_mic());
        REQUIRE(mixer.input.default_device == "mic");
        REQUIRE_FALSE(*audio.mic_muted());
    }

    SECTION("DeviceSwitchWithUnknownNullDeviceFallsBackToVolume") {
        mixer.input.volume = 0.9f;
        AudioController audio(mixer, {.mute_mode = MuteMode::DeviceSwitch, .null_device = "missing"});

        REQUIRE(*audio.toggle_mic());
        REQUIRE(mixer.input.default_device == "mic");
        REQUIRE(mixer.input.volume == Approx(0.0f));
    }

    SECTION("ToggleWithoutInputDeviceFails") {
        mixer.input.default_device.clear();
        AudioController audio(mixer, {});

        auto res = audio.toggle_mic();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == AudioError::Kind::NoDevice);
    }

    SECTION("InputDeviceNamePrefersDescription") {
        AudioController audio(mixer, {});
        REQUIRE(*audio.input_device_name() == "Built-in Microphone");
    }
}

TEST_CASE("AudioController change notifications", "[audio]") {
    MockAudioMixer mixer;

    SECTION("ObserversReceiveDirection") {
        AudioController audio(mixer, {});
        std::vector<AudioDirection> seen;
        audio.subscribe([&](AudioDirection dir) { seen.push_back(dir); });

        mixer.fire_change(AudioDirection::Input);
        mixer.fire_change(AudioDirection::Output);
        REQUIRE(seen == std::vector<AudioDirection>{AudioDirection::Input, AudioDirection::Output});
    }

    SECTION("UnsubscribedObserverIsNotCalled") {
        AudioController audio(mixer, {});
        int calls = 0;
        auto id = audio.subscribe([&](AudioDirection) { ++calls; });

        mixer.fire_change(AudioDirection::Output);
        audio.unsubscribe(id);
        mixer.fire_change(AudioDirection::Output);
        REQUIRE(calls == 1);
    }

    SECTION("DestructorDetachesFromMixer") {
        {
            AudioController audio(mixer, {});
            REQUIRE(mixer.has_callback());
        }
        REQUIRE_FALSE(mixer.has_callback());
    }
}
