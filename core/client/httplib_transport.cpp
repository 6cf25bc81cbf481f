#include "httplib_transport.hpp"

#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace micsync {
namespace client {

namespace {

httplib::Headers to_httplib_headers(const HeaderMap &headers) {
    httplib::Headers out;
    for (const auto &[name, value] : headers) {
        out.emplace(name, value);
    }
    return out;
}

}  // namespace

HttplibTransport::HttplibTransport(const HttplibTransportConfig &config) : config_(config) {
    url_valid_ = split_base_url(config_.base_url, origin_, path_prefix_);
    if (!url_valid_) {
        LOG_ERROR("[Transport] Invalid base URL: '" << config_.base_url << "'");
    }
}

HttplibTransport::~HttplibTransport() = default;

bool HttplibTransport::split_base_url(const std::string &base_url, std::string &origin, std::string &path_prefix) {
    const auto scheme_end = base_url.find("://");
    if (scheme_end == std::string::npos) {
        return false;
    }

    const std::string scheme = base_url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return false;
    }

    const auto host_start = scheme_end + 3;
    const auto path_start = base_url.find('/', host_start);
    if (path_start == host_start || host_start >= base_url.size()) {
        return false;
    }

    origin = base_url.substr(0, path_start);
    path_prefix = path_start == std::string::npos ? "" : base_url.substr(path_start);

    while (!path_prefix.empty() && path_prefix.back() == '/') {
        path_prefix.pop_back();
    }
    return true;
}

std::unique_ptr<httplib::Client> HttplibTransport::checkout_client() {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_clients_.empty()) {
            auto client = std::move(idle_clients_.back());
            idle_clients_.pop_back();
            return client;
        }
    }

    // httplib::Client auto-detects scheme and handles TLS when built with OpenSSL
    auto client = std::make_unique<httplib::Client>(origin_);
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    client->set_keep_alive(true);
    client->set_default_headers(to_httplib_headers(config_.default_headers));

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client->enable_server_certificate_verification(config_.verify_tls);
#endif

    return client;
}

void HttplibTransport::checkin_client(std::unique_ptr<httplib::Client> client) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (idle_clients_.size() < config_.max_pooled_clients) {
        idle_clients_.push_back(std::move(client));
    }
}

TransportError HttplibTransport::classify_error(httplib::Error err, std::chrono::milliseconds elapsed,
                                               std::chrono::milliseconds timeout) {
    switch (err) {
        case httplib::Error::Connection:
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
            return TransportError::CONNECTION;
        case httplib::Error::ConnectionTimeout:
            return TransportError::TIMEOUT;
        case httplib::Error::Read:
        case httplib::Error::Write:
            // httplib reports a reset peer and an expired timeout the same way
            return elapsed >= timeout ? TransportError::TIMEOUT : TransportError::CONNECTION;
        default:
            return TransportError::OTHER;
    }
}

size_t HttplibTransport::idle_client_count() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return idle_clients_.size();
}

HttpResponse HttplibTransport::send(const HttpRequest &request) {
    HttpResponse response;

    if (!url_valid_) {
        response.error = TransportError::CONNECTION;
        response.error_message = "invalid base URL '" + config_.base_url + "'";
        return response;
    }

    const std::string path = path_prefix_ + request.path;
    const httplib::Headers headers = to_httplib_headers(request.headers);
    const std::string &method = request.method;

    if (method != "GET" && method != "HEAD" && method != "POST" && method != "PUT" && method != "PATCH" &&
        method != "DELETE" && method != "OPTIONS") {
        response.error = TransportError::OTHER;
        response.error_message = "unsupported method " + method;
        return response;
    }

    auto client = checkout_client();

    auto dispatch = [&]() -> httplib::Result {
        if (method == "GET") {
            return client->Get(path, headers);
        }
        if (method == "HEAD") {
            return client->Head(path, headers);
        }
        if (method == "POST") {
            return client->Post(path, headers, request.body, request.content_type);
        }
        if (method == "PUT") {
            return client->Put(path, headers, request.body, request.content_type);
        }
        if (method == "PATCH") {
            return client->Patch(path, headers, request.body, request.content_type);
        }
        if (method == "DELETE") {
            return client->Delete(path, headers, request.body, request.content_type);
        }
        return client->Options(path, headers);
    };

    const auto started = std::chrono::steady_clock::now();
    auto result = dispatch();

    if (!result) {
        const auto err = result.error();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        response.error = classify_error(err, elapsed, std::chrono::milliseconds(config_.timeout_ms));
        response.error_message = httplib::to_string(err);
        LOG_DEBUG("[Transport] " << method << " " << origin_ << path << " failed: " << response.error_message);
        // Drop the client: its connection state is unknown after a failure
        return response;
    }

    response.status = result->status;
    response.body = result->body;
    for (const auto &[name, value] : result->headers) {
        response.headers.emplace(name, value);
    }

    checkin_client(std::move(client));
    return response;
}

}  // namespace client
}  // namespace micsync
