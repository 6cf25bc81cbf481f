#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>

#include "runtime/config.hpp"

namespace micsync {
namespace vendor { class VendorRegistry; }
namespace registry { class DeviceRegistry; }
namespace discovery { class ProgressTracker; }
namespace runtime { class ScanScheduler; }
}  // namespace micsync

namespace micsync {
namespace http {

/**
 * @brief Status server for the micsync runtime
 *
 * Exposes vendor health, scan progress and manual scan triggers over
 * JSON REST endpoints. It runs in its own thread and only reads from or
 * delegates to the runtime components.
 *
 * Thread model:
 * - Server runs in its own thread (listen_after_bind)
 * - Handlers execute in httplib's thread pool
 * - Components behind the references are thread-safe
 *
 * The scheduler may be null; POST /v0/discovery/{id}/scan then answers
 * UNAVAILABLE.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, const std::string &instance_name, vendor::VendorRegistry &vendors,
               registry::DeviceRegistry &devices, discovery::ProgressTracker &progress,
               runtime::ScanScheduler *scheduler);

    ~HttpServer();

    // Binds the configured address and starts the server thread
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    void setup_routes();

    // Route handlers (handlers/*.cpp)
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
    void handle_get_vendors(const httplib::Request &req, httplib::Response &res);
    void handle_get_vendor_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_devices(const httplib::Request &req, httplib::Response &res);
    void handle_get_discovery_status(const httplib::Request &req, httplib::Response &res);
    void handle_post_discovery_scan(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    std::string instance_name_;
    int port_ = 0;
    const std::chrono::steady_clock::time_point started_at_;

    vendor::VendorRegistry &vendors_;
    registry::DeviceRegistry &devices_;
    discovery::ProgressTracker &progress_;
    runtime::ScanScheduler *scheduler_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace http
}  // namespace micsync
