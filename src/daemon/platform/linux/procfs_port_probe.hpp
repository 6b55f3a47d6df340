#pragma once

#include "platform/port_probe.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

class ProcfsPortProbe : public PortProbe {
public:
    explicit ProcfsPortProbe(std::string proc_root = "/proc");

    bool is_listening(int port) const override;
    std::optional<PortOwner> owner(int port) const override;

    // Socket inodes in LISTEN state bound to the port, from the contents of
    // /proc/net/tcp or /proc/net/tcp6.
    static std::vector<uint64_t> parse_listen_inodes(std::istream& in, int port);

private:
    std::vector<uint64_t> listen_inodes(int port) const;
    std::string read_comm(int pid) const;

    std::string proc_root_;
};
