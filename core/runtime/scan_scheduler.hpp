#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "discovery/reconciler.hpp"
#include "registry/device_registry.hpp"
#include "task_queue.hpp"
#include "vendor/vendor_config.hpp"
#include "vendor/vendor_registry.hpp"

namespace micsync {
namespace runtime {

enum class TriggerResult { ACCEPTED, ALREADY_RUNNING, UNKNOWN_VENDOR, STOPPED };

const char *trigger_result_to_string(TriggerResult result);

/**
 * @brief Dispatches reconcile passes onto the task queue
 *
 * At most one pass per vendor is queued or running at any time. A pass
 * refreshes the vendor's devices in the registry, then runs the reconciler
 * with progress under status_key(vendor_id).
 *
 * Default scan options per vendor are the global CIDR/FQDN lists plus the
 * vendor's own.
 */
class ScanScheduler {
public:
    ScanScheduler(discovery::Reconciler &reconciler, vendor::VendorRegistry &vendors,
                  registry::DeviceRegistry &devices, TaskQueue &queue, discovery::ScanOptions global_options,
                  const std::vector<vendor::VendorConfig> &vendor_configs);

    ScanScheduler(const ScanScheduler &) = delete;
    ScanScheduler &operator=(const ScanScheduler &) = delete;

    // overrides replaces the vendor's default options for this pass only
    TriggerResult trigger(const std::string &vendor_id,
                          const std::optional<discovery::ScanOptions> &overrides = std::nullopt);

    bool is_running(const std::string &vendor_id) const;
    std::vector<std::string> in_flight() const;
    std::optional<discovery::ReconcileSummary> last_summary(const std::string &vendor_id) const;
    discovery::ScanOptions options_for(const std::string &vendor_id) const;

    // Waits until no pass is queued or running; false on timeout
    bool wait_idle(std::chrono::milliseconds timeout);

    // Running passes stop at their next checkpoint; new triggers are refused
    void cancel_all();

    // cancel_all(), then wait_idle(timeout)
    bool shutdown(std::chrono::milliseconds timeout);

    static std::string status_key(const std::string &vendor_id) { return "discovery:status:" + vendor_id; }

private:
    void run_pass(const std::string &vendor_id, const discovery::ScanOptions &options);

    discovery::Reconciler &reconciler_;
    vendor::VendorRegistry &vendors_;
    registry::DeviceRegistry &devices_;
    TaskQueue &queue_;
    const discovery::ScanOptions global_options_;
    std::map<std::string, discovery::ScanOptions> vendor_options_;

    discovery::CancellationToken cancel_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::set<std::string> in_flight_;
    std::map<std::string, discovery::ReconcileSummary> last_summaries_;
};

}  // namespace runtime
}  // namespace micsync
