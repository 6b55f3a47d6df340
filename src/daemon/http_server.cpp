#include "http_server.hpp"

#include <fmt/core.h>
#include <system_error>

using json = nlohmann::json;

HttpServer::HttpServer(ControlService& service, Options options,
                       const PortProbe* probe, bool verbose)
    : service_(service), options_(std::move(options)), probe_(probe), verbose_(verbose) {}

HttpServer::~HttpServer() {
    stop();
}

std::expected<void, ServerError> HttpServer::start() {
    if (running_.load(std::memory_order_acquire)) return {};

    srv_ = std::make_unique<httplib::Server>();
    auto workers = options_.worker_threads;
    srv_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    // No SO_REUSEPORT: a second instance must fail to bind, not share the port.
    srv_->set_socket_options([](socket_t sock) {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    });
    install_routes();

    int port = options_.port;
    bool bound = false;
    if (port == 0) {
        port = srv_->bind_to_any_port(options_.bind_address);
        bound = port > 0;
    } else {
        bound = srv_->bind_to_port(options_.bind_address, port);
    }

    if (!bound) {
        srv_.reset();
        return std::unexpected(bind_error());
    }

    bound_port_ = port;
    service_.begin_serving();
    running_.store(true, std::memory_order_release);

    try {
        thread_ = std::thread(&HttpServer::run, this);
    } catch (const std::system_error& e) {
        running_.store(false, std::memory_order_release);
        srv_->stop();
        srv_.reset();
        return std::unexpected(ServerError{ServerError::Kind::Thread,
                                           std::string("cannot start server thread: ") + e.what()});
    }

    log(fmt::format("HTTP listening on {}:{}", options_.bind_address, bound_port_));
    return {};
}

void HttpServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    // Release handlers parked on the bridge before the pool is joined.
    service_.drain();
    if (srv_) srv_->stop();
    if (thread_.joinable()) thread_.join();
    srv_.reset();
    log("HTTP server stopped");
}

void HttpServer::run() {
    if (!srv_->listen_after_bind()) {
        fmt::print(stderr, "http: listener on port {} exited with an error\n", bound_port_);
    }
}

ServerError HttpServer::bind_error() const {
    int port = options_.port;
    if (probe_ && port != 0 && probe_->is_listening(port)) {
        std::string msg = fmt::format("port {} is already in use", port);
        if (auto owner = probe_->owner(port)) {
            msg += fmt::format(" by {} (pid {})",
                               owner->command.empty() ? "unknown" : owner->command, owner->pid);
        }
        return {ServerError::Kind::PortInUse, msg};
    }
    return {ServerError::Kind::Bind,
            fmt::format("cannot bind {}:{}", options_.bind_address, port)};
}

void HttpServer::install_routes() {
    if (verbose_) {
        srv_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            fmt::print(stderr, "[micdrop] {} {} -> {}\n", req.method, req.path, res.status);
        });
    }

    srv_->set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) return;
        json body = {{"status", "error"},
                     {"message", res.status == 404 ? "not found" : "request failed"}};
        res.set_content(body.dump(), "application/json");
        apply_cors(res);
    });

    srv_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                       std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "unknown exception";
        }
        fmt::print(stderr, "http: handler for {} failed: {}\n", req.path, what);
        send(res, {500, {{"status", "error"}, {"message", what}}});
    });

    srv_->Options(R"(.*)", [this](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        apply_cors(res);
    });

    srv_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(service_.status_page(), "text/html; charset=utf-8");
        apply_cors(res);
    });

    srv_->Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.status());
    });

    srv_->Post("/toggle-mic", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.toggle_mic());
    });

    srv_->Post("/toggle-mic/fast", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.toggle_mic_fast());
    });

    srv_->Get("/volume", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.volume());
    });

    srv_->Post("/volume/increase", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.volume_increase());
    });

    srv_->Post("/volume/decrease", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.volume_decrease());
    });

    srv_->Post("/volume/toggle-mute", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.volume_toggle_mute());
    });

    srv_->Post("/volume/set", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, service_.volume_set(req.body));
    });

    srv_->Get("/mic/level", [this](const httplib::Request&, httplib::Response& res) {
        send(res, service_.mic_level());
    });

    srv_->Post("/bridge/mic-state", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, service_.bridge_mic_state(req.body));
    });

    // Long-poll for the extension; ?since=<seq> resumes after a reconnect.
    srv_->Get("/bridge/poll", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<uint64_t> since;
        if (req.has_param("since")) {
            try {
                since = std::stoull(req.get_param_value("since"));
            } catch (const std::exception&) {
                send(res, {400, {{"status", "error"}, {"message", "since must be a sequence number"}}});
                return;
            }
        }
        send(res, service_.bridge_poll(since));
    });

    srv_->Get("/history", [this](const httplib::Request& req, httplib::Response& res) {
        int limit = 10;
        if (req.has_param("limit")) {
            try {
                limit = std::stoi(req.get_param_value("limit"));
            } catch (const std::exception&) {
                send(res, {400, {{"status", "error"}, {"message", "limit must be a number"}}});
                return;
            }
        }
        send(res, service_.history(limit));
    });
}

void HttpServer::send(httplib::Response& res, const Reply& reply) const {
    res.status = reply.status;
    if (!reply.body.is_null()) {
        res.set_content(reply.body.dump(), "application/json");
    }
    apply_cors(res);
}

void HttpServer::apply_cors(httplib::Response& res) const {
    if (!options_.cors) return;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Accept, Authorization, Content-Type, Origin");
}

void HttpServer::log(const std::string& msg) {
    if (verbose_) {
        fmt::print(stderr, "[micdrop] {}\n", msg);
    }
}
