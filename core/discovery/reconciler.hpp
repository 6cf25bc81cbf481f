#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "address_expander.hpp"
#include "events/event_emitter.hpp"
#include "progress_tracker.hpp"
#include "registry/device_registry.hpp"
#include "vendor/vendor_registry.hpp"

namespace micsync {
namespace discovery {

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct ScanOptions {
    std::vector<std::string> scan_cidrs;
    std::vector<std::string> scan_fqdns;
    int max_hosts = 1024;  // Per CIDR
};

enum class ItemOutcome { APPLIED, SKIPPED, FAILED };

const char *item_outcome_to_string(ItemOutcome outcome);

struct ItemResult {
    std::string ip;
    ItemOutcome outcome = ItemOutcome::FAILED;
    std::string reason;  // Empty when applied
};

struct ReconcileDiff {
    std::vector<std::string> to_add;     // candidates - remote
    std::vector<std::string> to_remove;  // remote - candidates
};

// Aggregated outcome of one pass
struct ReconcileSummary {
    std::string vendor_id;
    bool ok = false;
    bool cancelled = false;
    std::string error;
    size_t candidates = 0;
    size_t to_add = 0;
    size_t to_remove = 0;
    std::vector<ItemResult> added;
    std::vector<ItemResult> removed;
    int64_t started_at = 0;
    int64_t finished_at = 0;

    size_t count(ItemOutcome outcome) const;
    nlohmann::json to_json() const;
};

/**
 * @brief Keeps a vendor's manual-discovery list in line with the local view
 *
 * One pass:
 *   1. gather: remote list + registry addresses + expanded CIDRs + resolved
 *      FQDNs (IPv4 only), deduplicated in first-seen order
 *   2. reconcile: fetch the remote list again and diff it against the
 *      candidates
 *   3. apply: adds (minus addresses another vendor owns), then removes
 *
 * Per-address and per-target problems are recorded and the pass carries
 * on. Failing to read the remote list ends the pass with an error.
 *
 * Stateless between passes; one pass per vendor at a time is the caller's
 * job.
 */
class Reconciler {
public:
    static constexpr int64_t kProgressEvery = 50;

    Reconciler(vendor::VendorRegistry &vendors, const registry::IDeviceRegistry &devices,
               std::shared_ptr<ProgressTracker> progress, std::shared_ptr<events::EventEmitter> emitter,
               ResolverFn resolver = system_resolve);

    /**
     * @brief Candidate set for a vendor
     *
     * A failed remote fetch is logged and treated as an empty remote list.
     */
    std::vector<std::string> gather_candidates(const std::string &vendor_id, const ScanOptions &opts);

    // Fresh remote fetch, then diff. False (error set) if the fetch fails.
    bool reconcile(const std::string &vendor_id, const std::vector<std::string> &candidates, ReconcileDiff &diff,
                   std::string &error);

    static ReconcileDiff compute_diff(const std::vector<std::string> &remote,
                                      const std::vector<std::string> &candidates);

    // Refuses, without contacting the vendor, an address registered to another vendor
    bool apply_add(const std::string &ip, const std::string &vendor_id);
    bool apply_remove(const std::string &ip, const std::string &vendor_id);

    /**
     * @brief gather_candidates() reporting progress under status_key
     *
     * Progress is written after each CIDR/FQDN and every kProgressEvery
     * addresses inside one. Ends with done (count = candidates) or error.
     * Unlike gather_candidates(), a failed remote fetch fails the scan.
     */
    bool run_with_progress(const std::string &vendor_id, const std::string &status_key, const ScanOptions &opts,
                           std::vector<std::string> &candidates, std::string &error,
                           const CancellationToken *cancel = nullptr);

    /**
     * @brief Full pass: gather, reconcile, apply
     *
     * Progress is reported when status_key is non-empty: scanning and
     * resolving while gathering, then reconciling, and done only once the
     * adds and removes were submitted. Any failure or cancellation,
     * including one after gathering, ends the status as error. Publishes a
     * ReconcileCompletedEvent when an emitter is set.
     */
    ReconcileSummary run(const std::string &vendor_id, const ScanOptions &opts, const std::string &status_key = "",
                         const CancellationToken *cancel = nullptr);

private:
    struct ScanContext {
        const std::string *status_key = nullptr;  // Null: no progress reporting
        const CancellationToken *cancel = nullptr;
        bool remote_required = false;
        bool finish_progress = true;  // False: the caller writes the terminal status

        // Filled in by collect()
        int64_t items_total = 0;
        int64_t items_processed = 0;
    };

    bool collect(const std::string &vendor_id, vendor::IVendorAdapter &adapter, const ScanOptions &opts,
                 ScanContext &ctx, std::vector<std::string> &out, std::string &error);

    // Empty reason: the address may be added for vendor_id
    std::string exclusivity_conflict(const std::string &ip, const std::string &vendor_id) const;

    void apply_batch(vendor::IVendorAdapter &adapter, const std::vector<std::string> &ips, bool add,
                     std::vector<ItemResult> &results);

    void publish_completed(const ReconcileSummary &summary);

    vendor::VendorRegistry &vendors_;
    const registry::IDeviceRegistry &devices_;
    std::shared_ptr<ProgressTracker> progress_;
    std::shared_ptr<events::EventEmitter> emitter_;
    ResolverFn resolver_;
};

}  // namespace discovery
}  // namespace micsync
