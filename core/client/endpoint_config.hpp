#pragma once

#include <set>
#include <string>

namespace micsync {
namespace client {

enum class AuthScheme {
    NONE,
    API_KEY,  // "Authorization: Bearer <key>" plus "x-api-key: <key>"
    BASIC,    // HTTP basic with username/password
};

struct Credentials {
    std::string api_key;
    std::string username;
    std::string password;
};

// Connection and resilience settings for one vendor endpoint.
// Immutable once a client has been built from it.
struct VendorEndpointConfig {
    std::string base_url;  // scheme://host[:port]; API prefix is added by the adapter profile
    AuthScheme auth_scheme = AuthScheme::NONE;
    Credentials credentials;

    int timeout_ms = 10000;
    int max_retries = 3;          // Extra attempts after the first
    double backoff_factor = 0.5;  // Seconds; delay = factor * 2^attempt
    std::set<int> retryable_status_codes{429, 500, 502, 503, 504};
    std::set<std::string> retry_methods{"HEAD", "GET", "PUT", "DELETE", "OPTIONS", "TRACE", "POST"};
    bool verify_tls = true;

    int failure_threshold = 5;
    int recovery_timeout_ms = 60000;

    std::string health_path = "/health";  // Relative to base_url
};

}  // namespace client
}  // namespace micsync
