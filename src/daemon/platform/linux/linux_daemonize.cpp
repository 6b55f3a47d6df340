#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fmt/core.h>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        fmt::print(stderr, "micdrop: fork() failed: {}\n", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    if (setsid() < 0) {
        fmt::print(stderr, "micdrop: setsid() failed: {}\n", std::strerror(errno));
        _exit(1);
    }

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Keep no directory busy.
    if (chdir("/") != 0) _exit(1);

    if (!freopen("/dev/null", "r", stdin) || !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

} // namespace platform
