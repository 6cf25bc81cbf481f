#include <chrono>

#include "../../registry/device_registry.hpp"
#include "../../runtime/scan_scheduler.hpp"
#include "../../vendor/vendor_registry.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace micsync {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_).count();

    nlohmann::json vendors_json = nlohmann::json::array();
    for (const auto &vendor_id : vendors_.get_vendor_ids()) {
        auto adapter = vendors_.get_adapter(vendor_id);
        if (!adapter) {
            continue;  // Removed since the id list was taken
        }
        vendors_json.push_back({{"vendor_id", vendor_id},
                                {"type", adapter->vendor_type()},
                                {"healthy", adapter->is_healthy()},
                                {"device_count", devices_.get_devices_for_vendor(vendor_id).size()}});
    }

    nlohmann::json in_flight = nlohmann::json::array();
    if (scheduler_ != nullptr) {
        for (const auto &vendor_id : scheduler_->in_flight()) {
            in_flight.push_back(vendor_id);
        }
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"name", instance_name_},
                               {"uptime_seconds", uptime},
                               {"vendors", vendors_json},
                               {"device_count", devices_.device_count()},
                               {"scans_in_flight", in_flight}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &req, httplib::Response &res) {
    std::vector<registry::RegisteredDevice> devices;
    if (req.has_param("vendor_id")) {
        devices = devices_.get_devices_for_vendor(req.get_param_value("vendor_id"));
    } else {
        devices = devices_.get_all_devices();
    }

    nlohmann::json devices_json = nlohmann::json::array();
    for (const auto &device : devices) {
        devices_json.push_back(device.to_json());
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"devices", devices_json}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace micsync
