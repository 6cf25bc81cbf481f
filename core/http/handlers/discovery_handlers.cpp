#include "../../discovery/progress_tracker.hpp"
#include "../../logging/logger.hpp"
#include "../../runtime/scan_scheduler.hpp"
#include "../../vendor/vendor_registry.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace micsync {
namespace http {

//=============================================================================
// GET /v0/discovery/{vendor_id}/status
//=============================================================================
void HttpServer::handle_get_discovery_status(const httplib::Request &req, httplib::Response &res) {
    std::string vendor_id;
    if (!parse_vendor_id(req, vendor_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path");
        return;
    }

    auto progress = progress_.get(runtime::ScanScheduler::status_key(vendor_id));
    if (!progress) {
        send_error(res, StatusCode::NOT_FOUND, "No scan recorded for vendor: " + vendor_id);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"vendor_id", vendor_id}};
    response["progress"] = progress->to_json();
    if (scheduler_ != nullptr) {
        response["running"] = scheduler_->is_running(vendor_id);
        if (auto summary = scheduler_->last_summary(vendor_id)) {
            response["last_pass"] = summary->to_json();
        }
    }
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/discovery/{vendor_id}/scan
//=============================================================================
void HttpServer::handle_post_discovery_scan(const httplib::Request &req, httplib::Response &res) {
    std::string vendor_id;
    if (!parse_vendor_id(req, vendor_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path");
        return;
    }

    if (scheduler_ == nullptr) {
        send_error(res, StatusCode::UNAVAILABLE, "Scan scheduling not enabled");
        return;
    }

    if (!vendors_.has_adapter(vendor_id)) {
        send_error(res, StatusCode::NOT_FOUND, "Vendor not found: " + vendor_id);
        return;
    }

    discovery::ScanOptions options = scheduler_->options_for(vendor_id);
    std::string error;
    if (!parse_scan_options(req.body, options, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    runtime::TriggerResult result = scheduler_->trigger(vendor_id, options);
    switch (result) {
        case runtime::TriggerResult::ACCEPTED: {
            LOG_INFO("[HTTP] Scan queued for " << vendor_id);
            nlohmann::json response = {{"status", make_status(StatusCode::ACCEPTED, "scan queued")},
                                       {"vendor_id", vendor_id},
                                       {"status_key", runtime::ScanScheduler::status_key(vendor_id)}};
            send_json(res, StatusCode::ACCEPTED, response);
            return;
        }
        case runtime::TriggerResult::ALREADY_RUNNING:
            send_error(res, StatusCode::ALREADY_RUNNING, "A scan is already running for vendor: " + vendor_id);
            return;
        case runtime::TriggerResult::UNKNOWN_VENDOR:
            send_error(res, StatusCode::NOT_FOUND, "Vendor not found: " + vendor_id);
            return;
        case runtime::TriggerResult::STOPPED:
        default:
            send_error(res, StatusCode::UNAVAILABLE, "Runtime is shutting down");
            return;
    }
}

}  // namespace http
}  // namespace micsync
