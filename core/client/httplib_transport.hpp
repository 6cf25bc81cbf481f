#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "http_transport.hpp"

namespace micsync {
namespace client {

struct HttplibTransportConfig {
    std::string base_url;       // scheme://host[:port][/prefix]
    int timeout_ms = 10000;     // Connect, read and write timeout
    bool verify_tls = true;     // Ignored without OpenSSL support
    HeaderMap default_headers;  // Sent with every request
    size_t max_pooled_clients = 20;
};

/**
 * @brief IHttpTransport backed by cpp-httplib
 *
 * httplib::Client is not safe for concurrent requests, so idle keep-alive
 * clients are pooled and each send() checks one out for its duration.
 * At most max_pooled_clients idle clients are retained.
 */
class HttplibTransport : public IHttpTransport {
public:
    explicit HttplibTransport(const HttplibTransportConfig &config);
    ~HttplibTransport() override;

    HttplibTransport(const HttplibTransport &) = delete;
    HttplibTransport &operator=(const HttplibTransport &) = delete;

    HttpResponse send(const HttpRequest &request) override;
    const std::string &base_url() const override { return config_.base_url; }

    // Splits "https://host:8443/api/v1" into origin and path prefix.
    // Returns false if the URL has no http(s) scheme or no host.
    static bool split_base_url(const std::string &base_url, std::string &origin, std::string &path_prefix);

    // Read/Write failures count as timeouts only once the timeout has elapsed
    static TransportError classify_error(httplib::Error err, std::chrono::milliseconds elapsed,
                                         std::chrono::milliseconds timeout);

    size_t idle_client_count() const;

private:
    std::unique_ptr<httplib::Client> checkout_client();
    void checkin_client(std::unique_ptr<httplib::Client> client);

    HttplibTransportConfig config_;
    std::string origin_;
    std::string path_prefix_;
    bool url_valid_ = false;

    mutable std::mutex pool_mutex_;
    std::vector<std::unique_ptr<httplib::Client>> idle_clients_;
};

}  // namespace client
}  // namespace micsync
