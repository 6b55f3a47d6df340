#pragma once

#include <optional>
#include <string>

struct PortOwner {
    int pid = 0;
    std::string command;
};

class PortProbe {
public:
    virtual ~PortProbe() = default;
    // True when some socket is listening on the TCP port.
    virtual bool is_listening(int port) const = 0;
    // Process holding the listening socket, when it can be determined.
    virtual std::optional<PortOwner> owner(int port) const = 0;
};
