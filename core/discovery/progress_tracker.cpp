#include "progress_tracker.hpp"

#include <algorithm>
#include <utility>

#include "events/event_types.hpp"
#include "logging/logger.hpp"

namespace micsync {
namespace discovery {

const char *scan_status_to_string(ScanStatus status) {
    switch (status) {
        case ScanStatus::RUNNING:
            return "running";
        case ScanStatus::DONE:
            return "done";
        case ScanStatus::ERROR:
            return "error";
        default:
            return "error";
    }
}

const char *scan_phase_to_string(ScanPhase phase) {
    switch (phase) {
        case ScanPhase::SCANNING:
            return "scanning";
        case ScanPhase::RESOLVING:
            return "resolving";
        case ScanPhase::RECONCILING:
            return "reconciling";
        default:
            return "scanning";
    }
}

nlohmann::json ScanProgress::to_json() const {
    nlohmann::json j = {
        {"status", scan_status_to_string(status)},
        {"phase", scan_phase_to_string(phase)},
        {"items_total", items_total},
        {"items_processed", items_processed},
        {"started_at", started_at},
    };

    if (target_kind == TargetKind::CIDR) {
        j["current_cidr"] = current_target;
    } else if (target_kind == TargetKind::FQDN) {
        j["current_fqdn"] = current_target;
    }
    if (finished_at) {
        j["finished_at"] = *finished_at;
    }
    if (error) {
        j["error"] = *error;
    }
    if (count) {
        j["count"] = *count;
    }
    return j;
}

bool ScanProgress::from_json(const nlohmann::json &j, ScanProgress &out, std::string &error) {
    if (!j.is_object()) {
        error = "progress is not a JSON object";
        return false;
    }

    try {
        ScanProgress p;
        const std::string status = j.value("status", "running");
        if (status == "running") {
            p.status = ScanStatus::RUNNING;
        } else if (status == "done") {
            p.status = ScanStatus::DONE;
        } else if (status == "error") {
            p.status = ScanStatus::ERROR;
        } else {
            error = "unknown status '" + status + "'";
            return false;
        }

        const std::string phase = j.value("phase", "scanning");
        if (phase == "resolving") {
            p.phase = ScanPhase::RESOLVING;
        } else if (phase == "reconciling") {
            p.phase = ScanPhase::RECONCILING;
        } else {
            p.phase = ScanPhase::SCANNING;
        }
        p.items_total = j.value("items_total", int64_t{0});
        p.items_processed = j.value("items_processed", int64_t{0});
        p.started_at = j.value("started_at", int64_t{0});

        if (j.contains("current_cidr")) {
            p.target_kind = TargetKind::CIDR;
            p.current_target = j.at("current_cidr").get<std::string>();
        } else if (j.contains("current_fqdn")) {
            p.target_kind = TargetKind::FQDN;
            p.current_target = j.at("current_fqdn").get<std::string>();
        }
        if (j.contains("finished_at") && !j.at("finished_at").is_null()) {
            p.finished_at = j.at("finished_at").get<int64_t>();
        }
        if (j.contains("error") && !j.at("error").is_null()) {
            p.error = j.at("error").get<std::string>();
        }
        if (j.contains("count") && !j.at("count").is_null()) {
            p.count = j.at("count").get<int64_t>();
        }

        out = std::move(p);
        return true;
    } catch (const nlohmann::json::exception &e) {
        error = std::string("malformed progress: ") + e.what();
        return false;
    }
}

ProgressTracker::ProgressTracker(std::shared_ptr<store::IKeyValueStore> store,
                                 std::shared_ptr<events::IPublisher> publisher, std::string topic,
                                 std::chrono::milliseconds ttl)
    : store_(std::move(store)), publisher_(std::move(publisher)), topic_(std::move(topic)), ttl_(ttl) {}

void ProgressTracker::init(const std::string &key, int64_t items_total) {
    std::lock_guard<std::mutex> lock(mutex_);

    ScanProgress progress;
    progress.items_total = std::max<int64_t>(items_total, 0);
    progress.started_at = events::now_epoch_ms();
    write(key, progress);
}

void ProgressTracker::update(const std::string &key, ScanPhase phase, int64_t items_processed,
                             TargetKind target_kind, const std::string &target) {
    std::lock_guard<std::mutex> lock(mutex_);

    ScanProgress progress = load(key);
    if (progress.is_terminal()) {
        LOG_DEBUG("[Progress] Ignoring update for finished scan " << key);
        return;
    }

    progress.phase = phase;
    progress.items_processed = std::max(progress.items_processed, items_processed);
    if (progress.items_total < progress.items_processed) {
        progress.items_total = progress.items_processed;
    }
    if (target_kind != TargetKind::NONE) {
        progress.target_kind = target_kind;
        progress.current_target = target;
    }
    write(key, progress);
}

void ProgressTracker::finish(const std::string &key, int64_t items_processed, int64_t items_total,
                             std::optional<int64_t> count) {
    std::lock_guard<std::mutex> lock(mutex_);

    ScanProgress progress = load(key);
    if (progress.is_terminal()) {
        LOG_DEBUG("[Progress] Scan " << key << " already " << scan_status_to_string(progress.status));
        return;
    }

    progress.status = ScanStatus::DONE;
    progress.items_total = std::max<int64_t>(items_total, 0);
    progress.items_processed = progress.items_total;
    if (items_processed != items_total) {
        LOG_DEBUG("[Progress] Scan " << key << " finished at " << items_processed << "/" << items_total
                                     << ", reporting complete");
    }
    progress.finished_at = events::now_epoch_ms();
    progress.error.reset();
    progress.count = count;
    write(key, progress);
}

void ProgressTracker::fail(const std::string &key, const std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);

    ScanProgress progress = load(key);
    if (progress.is_terminal()) {
        LOG_DEBUG("[Progress] Scan " << key << " already " << scan_status_to_string(progress.status));
        return;
    }

    progress.status = ScanStatus::ERROR;
    progress.finished_at = events::now_epoch_ms();
    progress.error = error;
    progress.count.reset();
    write(key, progress);
}

std::optional<ScanProgress> ProgressTracker::get(const std::string &key) const {
    nlohmann::json stored;
    const store::StoreStatus status = store_->get(key, stored);
    if (status != store::StoreStatus::OK) {
        if (status == store::StoreStatus::UNAVAILABLE) {
            LOG_WARN("[Progress] Store unavailable reading " << key);
        }
        return std::nullopt;
    }

    ScanProgress progress;
    std::string error;
    if (!ScanProgress::from_json(stored, progress, error)) {
        LOG_WARN("[Progress] Ignoring stored progress for " << key << ": " << error);
        return std::nullopt;
    }
    return progress;
}

ScanProgress ProgressTracker::load(const std::string &key) const {
    if (auto existing = get(key)) {
        return *existing;
    }

    // Missing or expired: start a record so the scan still reports something
    ScanProgress progress;
    progress.started_at = events::now_epoch_ms();
    return progress;
}

void ProgressTracker::write(const std::string &key, const ScanProgress &progress) {
    const nlohmann::json status = progress.to_json();

    const store::StoreStatus stored = store_->set(key, status, ttl_);
    if (stored != store::StoreStatus::OK) {
        LOG_WARN("[Progress] Failed to persist " << key << ": " << store::store_status_to_string(stored));
    }

    if (!publisher_) {
        return;
    }
    const nlohmann::json envelope = {{"type", "progress_update"}, {"status", status}};
    if (!publisher_->publish(topic_, envelope)) {
        LOG_DEBUG("[Progress] Publish to '" << topic_ << "' dropped for " << key);
    }
}

}  // namespace discovery
}  // namespace micsync
