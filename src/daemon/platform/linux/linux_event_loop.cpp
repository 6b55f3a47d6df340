#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(ConfigLoader loader, bool verbose)
    : loader_(std::move(loader)), verbose_(verbose),
      core_(loader_(), verbose_, mixer_, &level_monitor_, &port_probe_,
            // NotifyCallback
            [this]() {
                if (audio_event_fd_ < 0) return;
                uint64_t val = 1;
                if (::write(audio_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    fmt::print(stderr, "[micdrop] eventfd write failed: {}\n", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    core_.shutdown();
    mixer_.disconnect();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (audio_event_fd_ >= 0) ::close(audio_event_fd_);
}

bool LinuxEventLoop::init() {
    // Block before any thread is spawned so only the signalfd sees them.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        fmt::print(stderr, "signalfd failed: {}\n", std::strerror(errno));
        return false;
    }

    // Audio change notification eventfd
    audio_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (audio_event_fd_ < 0) {
        fmt::print(stderr, "eventfd failed: {}\n", std::strerror(errno));
        return false;
    }

    // Mixer (optional: audio routes answer with errors without it)
    if (auto res = mixer_.connect(); res) {
        log("PipeWire connected");
    } else {
        fmt::print(stderr, "audio: {}\n", res.error().message);
    }

    core_.init();

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        fmt::print(stderr, "epoll_create1 failed: {}\n", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(audio_event_fd_, EPOLLIN)) {
        fmt::print(stderr, "epoll_ctl failed: {}\n", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            fmt::print(stderr, "epoll_wait error: {}\n", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) != sizeof(info)) continue;

                if (info.ssi_signo == SIGHUP) {
                    log("Received SIGHUP");
                    core_.reload(loader_());
                    continue;
                }

                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == audio_event_fd_) {
                uint64_t val;
                if (::read(audio_event_fd_, &val, sizeof(val)) == sizeof(val)) {
                    core_.on_audio_changed();
                }
                continue;
            }
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        fmt::print(stderr, "[micdrop] {}\n", msg);
    }
}
