#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace micsync {
namespace http {

/**
 * @brief Status codes of the status server and their HTTP mapping
 *
 * - OK -> 200
 * - ACCEPTED -> 202 (scan queued)
 * - INVALID_ARGUMENT -> 400
 * - NOT_FOUND -> 404
 * - ALREADY_RUNNING -> 409
 * - UNAVAILABLE -> 503
 * - INTERNAL -> 500
 */
enum class StatusCode { OK, ACCEPTED, INVALID_ARGUMENT, NOT_FOUND, ALREADY_RUNNING, UNAVAILABLE, INTERNAL };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::ACCEPTED:
            return 202;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::ALREADY_RUNNING:
            return 409;
        case StatusCode::UNAVAILABLE:
            return 503;
        case StatusCode::INTERNAL:
        default:
            return 500;
    }
}

inline const char *status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::ACCEPTED:
            return "ACCEPTED";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::ALREADY_RUNNING:
            return "ALREADY_RUNNING";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case StatusCode::INTERNAL:
        default:
            return "INTERNAL";
    }
}

// {code, message}; message defaults to "ok" for OK and the code name otherwise
inline nlohmann::json make_status(StatusCode code, const std::string &message = "") {
    std::string msg = message;
    if (msg.empty()) {
        msg = code == StatusCode::OK ? "ok" : status_code_to_string(code);
    }
    return {{"code", status_code_to_string(code)}, {"message", msg}};
}

inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    return {{"status", make_status(code, message)}};
}

}  // namespace http
}  // namespace micsync
