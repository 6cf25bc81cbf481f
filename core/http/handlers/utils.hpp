#pragma once

#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../errors.hpp"
#include "discovery/reconciler.hpp"

namespace micsync {
namespace http {

// First regex capture of the route, e.g. the vendor id in /v0/vendors/([^/]+)/health
inline bool parse_vendor_id(const httplib::Request &req, std::string &vendor_id) {
    if (req.matches.size() >= 2) {
        vendor_id = req.matches[1].str();
        return !vendor_id.empty();
    }
    return false;
}

inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

inline void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    send_json(res, code, make_error_response(code, message));
}

inline bool read_string_list(const nlohmann::json &body, const char *key, std::vector<std::string> &out,
                             std::string &error) {
    if (!body.contains(key)) {
        return true;
    }
    const auto &value = body[key];
    if (!value.is_array()) {
        error = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    out.clear();
    for (const auto &item : value) {
        if (!item.is_string()) {
            error = std::string("'") + key + "' must be an array of strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

/**
 * @brief Scan options from a POST body, starting from the vendor's defaults
 *
 * Accepted keys: scan_cidrs, scan_fqdns (string arrays, replace the defaults)
 * and max_hosts (1-65536). An empty body keeps the defaults.
 */
inline bool parse_scan_options(const std::string &body_text, discovery::ScanOptions &options, std::string &error) {
    if (body_text.empty()) {
        return true;
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(body_text);
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }

    if (!body.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!read_string_list(body, "scan_cidrs", options.scan_cidrs, error) ||
        !read_string_list(body, "scan_fqdns", options.scan_fqdns, error)) {
        return false;
    }

    if (body.contains("max_hosts")) {
        const auto &value = body["max_hosts"];
        if (!value.is_number_integer() || value.get<int64_t>() < 1 || value.get<int64_t>() > 65536) {
            error = "'max_hosts' must be an integer in 1-65536";
            return false;
        }
        options.max_hosts = value.get<int>();
    }
    return true;
}

}  // namespace http
}  // namespace micsync
