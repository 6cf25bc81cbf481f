#pragma once

#include <map>
#include <string>

namespace micsync {
namespace client {

struct CaseInsensitiveLess {
    bool operator()(const std::string &a, const std::string &b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

enum class TransportError {
    NONE,        // A response was received (any status)
    CONNECTION,  // Refused, unreachable, reset, TLS handshake failure
    TIMEOUT,     // Connect, read or write timed out
    OTHER,
};

const char *transport_error_to_string(TransportError error);

// Percent-encodes everything outside RFC 3986 unreserved characters
std::string escape_path_segment(const std::string &segment);

// Path is relative to the transport's base URL (its path prefix included)
struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    HeaderMap headers;
};

struct HttpResponse {
    TransportError error = TransportError::NONE;
    std::string error_message;
    int status = 0;
    HeaderMap headers;
    std::string body;
};

/**
 * @brief One HTTP exchange against a fixed base URL
 *
 * Implementations must be safe to call from several threads at once.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse send(const HttpRequest &request) = 0;
    virtual const std::string &base_url() const = 0;
};

}  // namespace client
}  // namespace micsync
