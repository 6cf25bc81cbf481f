#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "events/i_publisher.hpp"
#include "store/kv_store.hpp"

namespace micsync {
namespace discovery {

enum class ScanStatus { RUNNING, DONE, ERROR };
enum class ScanPhase { SCANNING, RESOLVING, RECONCILING };

const char *scan_status_to_string(ScanStatus status);
const char *scan_phase_to_string(ScanPhase phase);

// Which kind of target current_target names
enum class TargetKind { NONE, CIDR, FQDN };

/**
 * @brief Status of one long-running candidate scan
 *
 * JSON shape:
 *   {status, phase, items_total, items_processed, current_cidr | current_fqdn,
 *    started_at, finished_at?, error?, count?}
 * Timestamps are epoch milliseconds.
 */
struct ScanProgress {
    ScanStatus status = ScanStatus::RUNNING;
    ScanPhase phase = ScanPhase::SCANNING;
    int64_t items_total = 0;
    int64_t items_processed = 0;
    TargetKind target_kind = TargetKind::NONE;
    std::string current_target;
    int64_t started_at = 0;
    std::optional<int64_t> finished_at;
    std::optional<std::string> error;
    std::optional<int64_t> count;

    bool is_terminal() const { return status != ScanStatus::RUNNING; }

    nlohmann::json to_json() const;
    static bool from_json(const nlohmann::json &j, ScanProgress &out, std::string &error);
};

/**
 * @brief Persists and broadcasts ScanProgress for scans keyed by status key
 *
 * Every write goes to the shared store (kept after completion until the TTL
 * drops it, so late pollers still see the terminal state) and is then
 * published as {"type": "progress_update", "status": {...}} on the topic.
 * Store and publish failures are logged and never reported to the caller.
 *
 * items_processed never decreases for a key, and once a scan is done or
 * failed further update()/finish()/fail() calls are ignored until init()
 * starts a new scan on the key.
 */
class ProgressTracker {
public:
    static constexpr std::chrono::milliseconds kDefaultTtl{3600 * 1000};

    ProgressTracker(std::shared_ptr<store::IKeyValueStore> store, std::shared_ptr<events::IPublisher> publisher,
                    std::string topic, std::chrono::milliseconds ttl = kDefaultTtl);

    void init(const std::string &key, int64_t items_total);

    void update(const std::string &key, ScanPhase phase, int64_t items_processed,
                TargetKind target_kind = TargetKind::NONE, const std::string &target = "");

    // items_processed is raised to items_total on success
    void finish(const std::string &key, int64_t items_processed, int64_t items_total,
                std::optional<int64_t> count = std::nullopt);

    void fail(const std::string &key, const std::string &error);

    std::optional<ScanProgress> get(const std::string &key) const;

    const std::string &topic() const { return topic_; }

private:
    // Current progress for key: store copy if readable, else a fresh RUNNING record
    ScanProgress load(const std::string &key) const;
    void write(const std::string &key, const ScanProgress &progress);

    std::shared_ptr<store::IKeyValueStore> store_;
    std::shared_ptr<events::IPublisher> publisher_;
    std::string topic_;
    std::chrono::milliseconds ttl_;

    // Serializes read-modify-write per process; cross-process writers are last-write-wins
    std::mutex mutex_;
};

}  // namespace discovery
}  // namespace micsync
