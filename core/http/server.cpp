#include "server.hpp"

#include "errors.hpp"
#include "logging/logger.hpp"

namespace micsync {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const std::string &instance_name,
                       vendor::VendorRegistry &vendors, registry::DeviceRegistry &devices,
                       discovery::ProgressTracker &progress, runtime::ScanScheduler *scheduler)
    : config_(config),
      instance_name_(instance_name),
      started_at_(std::chrono::steady_clock::now()),
      vendors_(vendors),
      devices_(devices),
      progress_(progress),
      scheduler_(scheduler) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    const int pool_size = config_.thread_pool_size > 0 ? config_.thread_pool_size : 1;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    setup_routes();

    // JSON body for errors raised outside a handler (unknown route, bad request)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        } else if (res.status == kStatusMethodNotAllowed) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Method not allowed: " + req.method + " " + req.path;
        }

        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });

    // Port 0 picks a free port
    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ <= 0) {
            error = "Failed to bind to " + config_.bind + " on any port";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    server_->Get("/v0/runtime/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_runtime_status(req, res); });

    server_->Get("/v0/vendors",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_vendors(req, res); });

    server_->Get(R"(/v0/vendors/([^/]+)/health)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_vendor_health(req, res); });

    server_->Get("/v0/devices",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_devices(req, res); });

    server_->Get(R"(/v0/discovery/([^/]+)/status)", [this](const httplib::Request &req, httplib::Response &res) {
        handle_get_discovery_status(req, res);
    });

    server_->Post(R"(/v0/discovery/([^/]+)/scan)", [this](const httplib::Request &req, httplib::Response &res) {
        handle_post_discovery_scan(req, res);
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /v0/runtime/status");
    LOG_INFO("[HTTP]   GET  /v0/vendors");
    LOG_INFO("[HTTP]   GET  /v0/vendors/{vendor_id}/health");
    LOG_INFO("[HTTP]   GET  /v0/devices");
    LOG_INFO("[HTTP]   GET  /v0/discovery/{vendor_id}/status");
    LOG_INFO("[HTTP]   POST /v0/discovery/{vendor_id}/scan");
}

}  // namespace http
}  // namespace micsync
