#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace micsync {
namespace client {

enum class ErrorKind {
    CIRCUIT_OPEN,  // Refused locally, no request sent
    RATE_LIMITED,  // Upstream 429
    CONNECTION,
    TIMEOUT,
    DECODE,        // 2xx with a body that is not JSON
    API,           // Any other non-2xx status
};

inline const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CIRCUIT_OPEN:
            return "CIRCUIT_OPEN";
        case ErrorKind::RATE_LIMITED:
            return "RATE_LIMITED";
        case ErrorKind::CONNECTION:
            return "CONNECTION";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::DECODE:
            return "DECODE";
        case ErrorKind::API:
            return "API";
        default:
            return "API";
    }
}

struct ApiError {
    ErrorKind kind = ErrorKind::API;
    int status_code = 0;                // 0 when no response was received
    std::optional<int> retry_after_s;   // RATE_LIMITED only, when the header was present
    std::string message;

    std::string describe() const {
        std::string out = error_kind_to_string(kind);
        if (status_code != 0) {
            out += " (HTTP " + std::to_string(status_code) + ")";
        }
        if (retry_after_s) {
            out += " retry after " + std::to_string(*retry_after_s) + "s";
        }
        if (!message.empty()) {
            out += ": " + message;
        }
        return out;
    }
};

/**
 * @brief Outcome of one logical request
 *
 * body is null for a 2xx with an empty payload and for every error.
 */
struct ApiResult {
    nlohmann::json body;
    std::optional<ApiError> error;

    bool ok() const { return !error.has_value(); }
};

}  // namespace client
}  // namespace micsync
