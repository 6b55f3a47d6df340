#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <charconv>
#include <csignal>
#include <fmt/core.h>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print("Usage: micdrop [options]\n");
    fmt::print("Options:\n");
    fmt::print("  -f, --foreground    Run in foreground (don't daemonize)\n");
    fmt::print("  -v, --verbose       Enable verbose logging\n");
    fmt::print("  -c, --config PATH   Config file path\n");
    fmt::print("  -p, --port N        HTTP port (overrides config)\n");
    fmt::print("      --bridge        Route mic toggles to the browser extension\n");
    fmt::print("  -h, --help          Show this help\n");
}

std::optional<int> parse_port(const std::string& s) {
    int port = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
    if (ec != std::errc() || ptr != s.data() + s.size() || port < 1 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

} // namespace

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    bool bridge = false;
    std::optional<int> port;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--port" || arg == "-p") {
            if (i + 1 >= argc || !(port = parse_port(argv[++i]))) {
                fmt::print(stderr, "micdrop: --port needs a number in 1..65535\n");
                return 1;
            }
        } else if (arg == "--bridge") {
            bridge = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            fmt::print(stderr, "micdrop: unknown option {}\n", arg);
            print_usage();
            return 1;
        }
    }

    // Command-line flags win over the file, also after a SIGHUP reload.
    auto load_config = [config_path, port, bridge]() {
        Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
        if (port) config.server.port = *port;
        if (bridge) config.bridge.enabled = true;
        return config;
    };

    if (!foreground) {
        platform::daemonize();
    }

    // A client hanging up mid-response must not kill the daemon.
    std::signal(SIGPIPE, SIG_IGN);

    if (verbose && foreground) {
        auto config = load_config();
        fmt::print(stderr, "[micdrop] Starting (port {}, {})\n", config.server.port,
                   config.bridge.enabled ? "bridge mode" : "direct mode");
    }

    LinuxEventLoop loop(load_config, verbose);
    if (!loop.init()) {
        fmt::print(stderr, "Failed to initialize event loop\n");
        return 1;
    }

    loop.run();
    return 0;
}
