#include "platform/platform_paths.hpp"

#include <arpa/inet.h>
#include <cstdlib>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace platform {

namespace {

std::string xdg_dir(const char* var, const char* fallback) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/micdrop";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + fallback + "/micdrop";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", "/.config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", "/.local/share");
}

std::string local_ipv4() {
    ifaddrs* addrs = nullptr;
    if (getifaddrs(&addrs) != 0) return "127.0.0.1";

    std::string result = "127.0.0.1";
    for (auto* ifa = addrs; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

        char buf[INET_ADDRSTRLEN];
        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            result = buf;
            break;
        }
    }

    freeifaddrs(addrs);
    return result;
}

} // namespace platform
