#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct HttpResponse {
    long status = 0;
    nlohmann::json body; // null for empty bodies
};

// Blocking JSON client for the daemon's HTTP endpoint.
class HttpClient {
public:
    HttpClient(std::string host, int port);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpResponse, std::string> get(const std::string& path, long timeout_s = 10);
    std::expected<HttpResponse, std::string> post(const std::string& path,
                                                  const std::string& body = {},
                                                  long timeout_s = 10);

    const std::string& base_url() const { return base_url_; }

private:
    std::expected<HttpResponse, std::string> perform(const std::string& path, bool post,
                                                     const std::string& body, long timeout_s);

    std::string base_url_;
};
