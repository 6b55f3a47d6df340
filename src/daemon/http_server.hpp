#pragma once

#include "control_service.hpp"
#include "platform/port_probe.hpp"

#include <atomic>
#include <expected>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

struct ServerError {
    enum class Kind { PortInUse, Bind, Thread };

    Kind kind = Kind::Bind;
    std::string message;
};

// HTTP/JSON front of ControlService. Serves on its own listener thread with a
// worker pool, so a handler parked on the bridge never blocks other routes.
class HttpServer {
public:
    struct Options {
        std::string bind_address = "0.0.0.0";
        int port = 8765; // 0 picks a free port
        bool cors = true;
        size_t worker_threads = 16;
    };

    // probe is optional and only used to explain bind failures.
    HttpServer(ControlService& service, Options options,
               const PortProbe* probe = nullptr, bool verbose = false);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // No-op when already running.
    std::expected<void, ServerError> start();
    // No-op when not running.
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    int port() const { return bound_port_; }

private:
    void run();
    void install_routes();
    ServerError bind_error() const;

    void send(httplib::Response& res, const Reply& reply) const;
    void apply_cors(httplib::Response& res) const;

    void log(const std::string& msg);

    ControlService& service_;
    Options options_;
    const PortProbe* probe_;
    bool verbose_;

    std::unique_ptr<httplib::Server> srv_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    int bound_port_ = 0;
};
