#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <string>

#include "config.hpp"
#include "discovery/progress_tracker.hpp"
#include "discovery/reconciler.hpp"
#include "events/event_emitter.hpp"
#include "http/server.hpp"
#include "registry/device_registry.hpp"
#include "resilience/rate_limiter.hpp"
#include "scan_scheduler.hpp"
#include "store/in_memory_store.hpp"
#include "task_queue.hpp"
#include "vendor/vendor_registry.hpp"

namespace micsync {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (store, vendors, scheduler, HTTP)
    bool initialize(std::string &error);

    // Main loop (blocking): periodic passes until stop() or a signal
    void run();

    // One pass for every vendor, waits for all of them; true if every pass succeeded
    bool run_once();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops the HTTP server, cancels passes and drains the task queue
    void shutdown();

    vendor::VendorRegistry &get_vendor_registry() { return *vendor_registry_; }
    registry::DeviceRegistry &get_device_registry() { return *device_registry_; }
    discovery::ProgressTracker &get_progress_tracker() { return *progress_; }
    ScanScheduler &get_scheduler() { return *scheduler_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }

private:
    // Staged initialization helpers
    bool init_core_services(std::string &error);
    bool init_vendors(std::string &error);
    bool init_discovery(std::string &error);
    bool init_http(std::string &error);

    void schedule_due_passes();

    RuntimeConfig config_;

    std::shared_ptr<store::InMemoryStore> store_;
    std::shared_ptr<events::EventEmitter> event_emitter_;  // Progress fan-out + reconcile events
    std::shared_ptr<resilience::RateLimiter> rate_limiter_;
    std::unique_ptr<registry::DeviceRegistry> device_registry_;
    std::unique_ptr<vendor::VendorRegistry> vendor_registry_;
    std::shared_ptr<discovery::ProgressTracker> progress_;
    std::unique_ptr<discovery::Reconciler> reconciler_;
    std::unique_ptr<TaskQueue> task_queue_;
    std::unique_ptr<ScanScheduler> scheduler_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::map<std::string, std::chrono::steady_clock::time_point> next_due_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace micsync
