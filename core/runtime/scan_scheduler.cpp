#include "scan_scheduler.hpp"

#include <algorithm>
#include <utility>

#include "logging/logger.hpp"

namespace micsync {
namespace runtime {

namespace {

void append_unique(std::vector<std::string> &dst, const std::vector<std::string> &src) {
    for (const auto &item : src) {
        if (std::find(dst.begin(), dst.end(), item) == dst.end()) {
            dst.push_back(item);
        }
    }
}

}  // namespace

const char *trigger_result_to_string(TriggerResult result) {
    switch (result) {
        case TriggerResult::ACCEPTED:
            return "ACCEPTED";
        case TriggerResult::ALREADY_RUNNING:
            return "ALREADY_RUNNING";
        case TriggerResult::UNKNOWN_VENDOR:
            return "UNKNOWN_VENDOR";
        case TriggerResult::STOPPED:
            return "STOPPED";
        default:
            return "STOPPED";
    }
}

ScanScheduler::ScanScheduler(discovery::Reconciler &reconciler, vendor::VendorRegistry &vendors,
                             registry::DeviceRegistry &devices, TaskQueue &queue,
                             discovery::ScanOptions global_options,
                             const std::vector<vendor::VendorConfig> &vendor_configs)
    : reconciler_(reconciler),
      vendors_(vendors),
      devices_(devices),
      queue_(queue),
      global_options_(std::move(global_options)) {
    for (const auto &vc : vendor_configs) {
        discovery::ScanOptions opts = global_options_;
        append_unique(opts.scan_cidrs, vc.cidrs);
        append_unique(opts.scan_fqdns, vc.fqdns);
        vendor_options_[vc.id] = std::move(opts);
    }
}

discovery::ScanOptions ScanScheduler::options_for(const std::string &vendor_id) const {
    auto it = vendor_options_.find(vendor_id);
    if (it != vendor_options_.end()) {
        return it->second;
    }
    return global_options_;
}

TriggerResult ScanScheduler::trigger(const std::string &vendor_id,
                                     const std::optional<discovery::ScanOptions> &overrides) {
    if (cancel_.is_cancelled()) {
        return TriggerResult::STOPPED;
    }
    if (!vendors_.has_adapter(vendor_id)) {
        return TriggerResult::UNKNOWN_VENDOR;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_.insert(vendor_id).second) {
            return TriggerResult::ALREADY_RUNNING;
        }
    }

    discovery::ScanOptions options = overrides ? *overrides : options_for(vendor_id);
    const bool queued = queue_.submit("reconcile:" + vendor_id,
                                      [this, vendor_id, options]() { run_pass(vendor_id, options); });
    if (!queued) {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(vendor_id);
        idle_cv_.notify_all();
        return TriggerResult::STOPPED;
    }

    LOG_DEBUG("[Scheduler] Queued reconcile pass for " << vendor_id);
    return TriggerResult::ACCEPTED;
}

void ScanScheduler::run_pass(const std::string &vendor_id, const discovery::ScanOptions &options) {
    auto adapter = vendors_.get_adapter(vendor_id);
    if (adapter && !cancel_.is_cancelled()) {
        // Device inventory feeds the candidate set and the exclusivity check
        if (!devices_.refresh_vendor(vendor_id, *adapter)) {
            LOG_WARN("[Scheduler] Device refresh failed for " << vendor_id << ", using previous inventory");
        }
    }
    discovery::ReconcileSummary summary = reconciler_.run(vendor_id, options, status_key(vendor_id), &cancel_);

    std::lock_guard<std::mutex> lock(mutex_);
    last_summaries_[vendor_id] = std::move(summary);
    in_flight_.erase(vendor_id);
    idle_cv_.notify_all();
}

bool ScanScheduler::is_running(const std::string &vendor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(vendor_id) > 0;
}

std::vector<std::string> ScanScheduler::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(in_flight_.begin(), in_flight_.end());
}

std::optional<discovery::ReconcileSummary> ScanScheduler::last_summary(const std::string &vendor_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_summaries_.find(vendor_id);
    if (it == last_summaries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ScanScheduler::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_.empty(); });
}

void ScanScheduler::cancel_all() {
    cancel_.cancel();
    LOG_INFO("[Scheduler] Cancelling in-flight passes");
}

bool ScanScheduler::shutdown(std::chrono::milliseconds timeout) {
    cancel_all();
    if (!wait_idle(timeout)) {
        LOG_WARN("[Scheduler] Passes still running " << timeout.count() << "ms after cancel: "
                                                      << in_flight().size());
        return false;
    }
    return true;
}

}  // namespace runtime
}  // namespace micsync
