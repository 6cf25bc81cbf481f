#include "../../logging/logger.hpp"
#include "../../vendor/vendor_registry.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace micsync {
namespace http {

//=============================================================================
// GET /v0/vendors
//=============================================================================
void HttpServer::handle_get_vendors(const httplib::Request &, httplib::Response &res) {
    nlohmann::json vendors_json = nlohmann::json::array();
    for (const auto &vendor_id : vendors_.get_vendor_ids()) {
        auto adapter = vendors_.get_adapter(vendor_id);
        if (adapter) {
            vendors_json.push_back(adapter->status());
        }
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"vendors", vendors_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/vendors/{vendor_id}/health
//=============================================================================
void HttpServer::handle_get_vendor_health(const httplib::Request &req, httplib::Response &res) {
    std::string vendor_id;
    if (!parse_vendor_id(req, vendor_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path");
        return;
    }

    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        send_error(res, StatusCode::NOT_FOUND, "Vendor not found: " + vendor_id);
        return;
    }

    // Live probe through the vendor's client; a failed probe is still a 200 report
    client::HealthReport report = adapter->check_health();
    LOG_DEBUG("[HTTP] Health probe " << vendor_id << ": " << client::health_status_to_string(report.status));

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"vendor_id", vendor_id}};
    response["health"] = report.to_json();
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace micsync
