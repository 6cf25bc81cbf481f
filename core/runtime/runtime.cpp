#include "runtime.hpp"

#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace micsync {
namespace runtime {

namespace {
constexpr std::chrono::milliseconds kLoopInterval{100};
}  // namespace

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing " << config_.runtime.name);

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_vendors(error)) {
        return false;
    }

    if (!init_discovery(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &) {
    store_ = std::make_shared<store::InMemoryStore>();

    // Default: 100 events per subscriber queue, max 32 subscribers
    event_emitter_ = std::make_shared<events::EventEmitter>(100, 32);
    LOG_INFO("[Runtime] Event emitter created (max " << event_emitter_->max_subscribers() << " subscribers)");

    rate_limiter_ = std::make_shared<resilience::RateLimiter>(
        store_, std::chrono::milliseconds(config_.store.rate_limit_ttl_ms));

    device_registry_ = std::make_unique<registry::DeviceRegistry>();
    vendor_registry_ = std::make_unique<vendor::VendorRegistry>();
    return true;
}

bool Runtime::init_vendors(std::string &error) {
    vendor::AdapterDeps deps;
    deps.rate_limiter = rate_limiter_;

    for (const auto &vendor_config : config_.vendors) {
        LOG_INFO("[Runtime] Creating adapter: " << vendor_config.id << " (" << vendor_config.type << ")");

        std::string adapter_error;
        auto adapter = vendor_registry_->create_adapter(vendor_config, deps, adapter_error);
        if (!adapter) {
            LOG_ERROR("[Runtime] Skipping vendor '" << vendor_config.id << "': " << adapter_error);
            continue;
        }
        vendor_registry_->add_adapter(vendor_config.id, adapter);
    }

    if (vendor_registry_->adapter_count() == 0) {
        error = "No vendor adapter could be initialized";
        return false;
    }

    LOG_INFO("[Runtime] " << vendor_registry_->adapter_count() << " of " << config_.vendors.size()
                          << " vendor(s) ready");
    return true;
}

bool Runtime::init_discovery(std::string &) {
    progress_ = std::make_shared<discovery::ProgressTracker>(store_, event_emitter_, config_.discovery.progress_topic,
                                                             std::chrono::milliseconds(config_.store.progress_ttl_ms));

    reconciler_ =
        std::make_unique<discovery::Reconciler>(*vendor_registry_, *device_registry_, progress_, event_emitter_);

    task_queue_ = std::make_unique<TaskQueue>(static_cast<size_t>(config_.discovery.workers), "reconcile");

    discovery::ScanOptions global_options;
    global_options.scan_cidrs = config_.discovery.scan_cidrs;
    global_options.scan_fqdns = config_.discovery.scan_fqdns;
    global_options.max_hosts = config_.discovery.max_hosts;

    scheduler_ = std::make_unique<ScanScheduler>(*reconciler_, *vendor_registry_, *device_registry_, *task_queue_,
                                                 global_options, config_.vendors);
    LOG_INFO("[Runtime] Scheduler ready (" << config_.discovery.workers << " worker(s))");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.runtime.name, *vendor_registry_,
                                                          *device_registry_, *progress_, scheduler_.get());

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::schedule_due_passes() {
    const auto now = std::chrono::steady_clock::now();
    const auto interval = std::chrono::milliseconds(config_.discovery.interval_ms);

    for (const auto &vendor_id : vendor_registry_->get_vendor_ids()) {
        auto it = next_due_.find(vendor_id);
        if (it != next_due_.end() && now < it->second) {
            continue;
        }

        TriggerResult result = scheduler_->trigger(vendor_id);
        if (result == TriggerResult::ACCEPTED) {
            next_due_[vendor_id] = now + interval;
        } else if (result == TriggerResult::ALREADY_RUNNING) {
            // Previous pass still busy; check again next tick
            LOG_DEBUG("[Runtime] Pass for " << vendor_id << " still running");
        } else {
            LOG_WARN("[Runtime] Could not schedule " << vendor_id << ": " << trigger_result_to_string(result));
            next_due_[vendor_id] = now + interval;
        }
    }
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    if (config_.discovery.enabled) {
        LOG_INFO("[Runtime] Periodic discovery every " << config_.discovery.interval_ms << "ms");
    } else {
        LOG_INFO("[Runtime] Periodic discovery disabled; passes run on request only");
    }

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        if (config_.discovery.enabled) {
            schedule_due_passes();
        }

        std::this_thread::sleep_for(kLoopInterval);
    }

    LOG_INFO("[Runtime] Main loop exited");
}

bool Runtime::run_once() {
    const auto vendor_ids = vendor_registry_->get_vendor_ids();
    LOG_INFO("[Runtime] Running a single pass for " << vendor_ids.size() << " vendor(s)");

    bool all_ok = true;
    for (const auto &vendor_id : vendor_ids) {
        TriggerResult result = scheduler_->trigger(vendor_id);
        if (result != TriggerResult::ACCEPTED) {
            LOG_ERROR("[Runtime] Could not start pass for " << vendor_id << ": "
                                                            << trigger_result_to_string(result));
            all_ok = false;
        }
    }

    // A single pass has no upper bound; SIGINT still cuts it short
    while (!scheduler_->wait_idle(kLoopInterval)) {
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, cancelling passes");
            scheduler_->cancel_all();
            scheduler_->wait_idle(std::chrono::milliseconds(config_.runtime.shutdown_timeout_ms));
            return false;
        }
    }

    for (const auto &vendor_id : vendor_ids) {
        auto summary = scheduler_->last_summary(vendor_id);
        if (!summary || !summary->ok) {
            all_ok = false;
        }
    }
    return all_ok;
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    running_ = false;

    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (scheduler_) {
        LOG_INFO("[Runtime] Cancelling discovery passes");
        scheduler_->shutdown(std::chrono::milliseconds(config_.runtime.shutdown_timeout_ms));
    }

    if (task_queue_) {
        LOG_INFO("[Runtime] Draining task queue");
        task_queue_->stop();
    }

    if (event_emitter_) {
        event_emitter_->shutdown();
    }

    if (vendor_registry_) {
        vendor_registry_->clear();
    }
    LOG_INFO("[Runtime] Shutdown complete");
}

}  // namespace runtime
}  // namespace micsync
