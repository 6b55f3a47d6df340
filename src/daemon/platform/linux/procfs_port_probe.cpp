#include "platform/linux/procfs_port_probe.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* TCP_LISTEN = "0A";

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

ProcfsPortProbe::ProcfsPortProbe(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

bool ProcfsPortProbe::is_listening(int port) const {
    return !listen_inodes(port).empty();
}

std::optional<PortOwner> ProcfsPortProbe::owner(int port) const {
    auto inodes = listen_inodes(port);
    if (inodes.empty()) return std::nullopt;

    // Processes may exit mid-scan.
    std::error_code ec;
    for (fs::directory_iterator proc(proc_root_, ec), end; !ec && proc != end; proc.increment(ec)) {
        auto name = proc->path().filename().string();
        if (!is_number(name)) continue;

        std::error_code fd_ec;
        for (fs::directory_iterator fd(proc->path() / "fd", fd_ec); !fd_ec && fd != end;
             fd.increment(fd_ec)) {
            std::error_code link_ec;
            auto target = fs::read_symlink(fd->path(), link_ec).string();
            if (link_ec || !target.starts_with("socket:[")) continue;

            uint64_t inode = std::strtoull(target.c_str() + 8, nullptr, 10);
            if (std::ranges::find(inodes, inode) != inodes.end()) {
                int pid = std::stoi(name);
                return PortOwner{.pid = pid, .command = read_comm(pid)};
            }
        }
    }
    return std::nullopt;
}

std::vector<uint64_t> ProcfsPortProbe::parse_listen_inodes(std::istream& in, int port) {
    std::vector<uint64_t> inodes;
    std::string line;
    std::getline(in, line); // header

    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string slot, local, remote, state, queues, timer, retrnsmt, uid, timeout, inode;
        if (!(fields >> slot >> local >> remote >> state >> queues >> timer
                     >> retrnsmt >> uid >> timeout >> inode)) {
            continue;
        }
        if (state != TCP_LISTEN) continue;

        auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;
        int local_port = static_cast<int>(std::strtol(local.c_str() + colon + 1, nullptr, 16));
        if (local_port != port) continue;

        inodes.push_back(std::strtoull(inode.c_str(), nullptr, 10));
    }
    return inodes;
}

std::vector<uint64_t> ProcfsPortProbe::listen_inodes(int port) const {
    std::vector<uint64_t> inodes;
    for (const char* table : {"/net/tcp", "/net/tcp6"}) {
        std::ifstream f(proc_root_ + table);
        if (!f.is_open()) continue;
        auto found = parse_listen_inodes(f, port);
        inodes.insert(inodes.end(), found.begin(), found.end());
    }
    return inodes;
}

std::string ProcfsPortProbe::read_comm(int pid) const {
    std::ifstream f(fmt::format("{}/{}/comm", proc_root_, pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}
