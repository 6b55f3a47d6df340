#pragma once

#include <string>

struct AudioError {
    enum class Kind {
        NoDevice,    // no default device for the requested direction
        Unsupported, // the device lacks the property (e.g. no hardware mute)
        Backend,     // the audio server rejected or failed the call
    };

    Kind kind = Kind::Backend;
    std::string message;

    static AudioError no_device(std::string msg) { return {Kind::NoDevice, std::move(msg)}; }
    static AudioError unsupported(std::string msg) { return {Kind::Unsupported, std::move(msg)}; }
    static AudioError backend(std::string msg) { return {Kind::Backend, std::move(msg)}; }
};
