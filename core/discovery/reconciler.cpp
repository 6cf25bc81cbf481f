#include "reconciler.hpp"

#include <unordered_set>
#include <utility>

#include "events/event_types.hpp"
#include "logging/logger.hpp"

namespace micsync {
namespace discovery {

namespace {

const char *const kCancelled = "cancelled";

// Appends ip if not seen yet
class OrderedSet {
public:
    explicit OrderedSet(std::vector<std::string> &out) : out_(out) {
        for (const auto &ip : out_) {
            seen_.insert(ip);
        }
    }

    bool add(const std::string &ip) {
        if (!seen_.insert(ip).second) {
            return false;
        }
        out_.push_back(ip);
        return true;
    }

private:
    std::vector<std::string> &out_;
    std::unordered_set<std::string> seen_;
};

bool cancelled(const CancellationToken *token) { return token != nullptr && token->is_cancelled(); }

}  // namespace

const char *item_outcome_to_string(ItemOutcome outcome) {
    switch (outcome) {
        case ItemOutcome::APPLIED:
            return "applied";
        case ItemOutcome::SKIPPED:
            return "skipped";
        case ItemOutcome::FAILED:
            return "failed";
        default:
            return "failed";
    }
}

size_t ReconcileSummary::count(ItemOutcome outcome) const {
    size_t n = 0;
    for (const auto &item : added) {
        n += item.outcome == outcome ? 1 : 0;
    }
    for (const auto &item : removed) {
        n += item.outcome == outcome ? 1 : 0;
    }
    return n;
}

nlohmann::json ReconcileSummary::to_json() const {
    auto items_json = [](const std::vector<ItemResult> &items) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &item : items) {
            nlohmann::json j = {{"ip", item.ip}, {"outcome", item_outcome_to_string(item.outcome)}};
            if (!item.reason.empty()) {
                j["reason"] = item.reason;
            }
            arr.push_back(std::move(j));
        }
        return arr;
    };

    nlohmann::json j = {
        {"vendor_id", vendor_id},
        {"ok", ok},
        {"cancelled", cancelled},
        {"candidates", candidates},
        {"to_add", to_add},
        {"to_remove", to_remove},
        {"added", items_json(added)},
        {"removed", items_json(removed)},
        {"started_at", started_at},
        {"finished_at", finished_at},
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

Reconciler::Reconciler(vendor::VendorRegistry &vendors, const registry::IDeviceRegistry &devices,
                       std::shared_ptr<ProgressTracker> progress, std::shared_ptr<events::EventEmitter> emitter,
                       ResolverFn resolver)
    : vendors_(vendors),
      devices_(devices),
      progress_(std::move(progress)),
      emitter_(std::move(emitter)),
      resolver_(resolver ? std::move(resolver) : ResolverFn(system_resolve)) {}

std::vector<std::string> Reconciler::gather_candidates(const std::string &vendor_id, const ScanOptions &opts) {
    std::vector<std::string> candidates;

    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        LOG_WARN("[Reconciler] Unknown vendor: " << vendor_id);
        return candidates;
    }

    std::string error;
    ScanContext ctx;
    if (!collect(vendor_id, *adapter, opts, ctx, candidates, error)) {
        LOG_WARN("[Reconciler] " << vendor_id << " candidate scan incomplete: " << error);
    }
    return candidates;
}

bool Reconciler::run_with_progress(const std::string &vendor_id, const std::string &status_key,
                                   const ScanOptions &opts, std::vector<std::string> &candidates, std::string &error,
                                   const CancellationToken *cancel) {
    candidates.clear();

    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        error = "unknown vendor '" + vendor_id + "'";
        if (progress_) {
            progress_->init(status_key, 0);
            progress_->fail(status_key, error);
        }
        return false;
    }

    ScanContext ctx;
    ctx.status_key = &status_key;
    ctx.cancel = cancel;
    ctx.remote_required = true;
    return collect(vendor_id, *adapter, opts, ctx, candidates, error);
}

bool Reconciler::collect(const std::string &vendor_id, vendor::IVendorAdapter &adapter, const ScanOptions &opts,
                         ScanContext &ctx, std::vector<std::string> &out, std::string &error) {
    ProgressTracker *progress = ctx.status_key != nullptr ? progress_.get() : nullptr;
    const std::string key = ctx.status_key != nullptr ? *ctx.status_key : std::string();

    auto fail = [&](const std::string &message) {
        error = message;
        if (progress != nullptr) {
            progress->fail(key, message);
        }
        return false;
    };

    // Expansion is pure and bounded, do it up front to size the scan
    std::vector<std::pair<std::string, std::vector<std::string>>> networks;
    int64_t items_total = 0;
    for (const auto &cidr : opts.scan_cidrs) {
        auto hosts = expand_cidr(cidr, opts.max_hosts);
        items_total += static_cast<int64_t>(hosts.size());
        networks.emplace_back(cidr, std::move(hosts));
    }
    items_total += static_cast<int64_t>(opts.scan_fqdns.size());
    ctx.items_total = items_total;
    ctx.items_processed = 0;

    if (progress != nullptr) {
        progress->init(key, items_total);
    }

    OrderedSet candidates(out);

    // (a) remote list
    std::vector<std::string> remote;
    if (adapter.get_discovery_ips(remote)) {
        for (const auto &ip : filter_ipv4(remote)) {
            candidates.add(ip);
        }
    } else if (ctx.remote_required) {
        return fail("remote discovery fetch failed: " + adapter.last_error());
    } else {
        LOG_WARN("[Reconciler] " << vendor_id << " remote discovery list unavailable, continuing without it: "
                                 << adapter.last_error());
    }

    // (b) registry
    for (const auto &ip : devices_.ips_for_vendor(vendor_id)) {
        if (is_valid_ipv4(ip)) {
            candidates.add(ip);
        }
    }

    int64_t processed = 0;

    // (c) CIDRs
    for (const auto &[cidr, hosts] : networks) {
        if (cancelled(ctx.cancel)) {
            return fail(kCancelled);
        }
        if (hosts.empty()) {
            LOG_WARN("[Reconciler] " << vendor_id << " skipping CIDR with no usable hosts: " << cidr);
        }

        int64_t since_report = 0;
        for (const auto &host : hosts) {
            candidates.add(host);
            ++processed;
            if (progress != nullptr && ++since_report >= kProgressEvery) {
                progress->update(key, ScanPhase::SCANNING, processed, TargetKind::CIDR, cidr);
                since_report = 0;
            }
        }
        if (progress != nullptr) {
            progress->update(key, ScanPhase::SCANNING, processed, TargetKind::CIDR, cidr);
        }
    }

    // (d) FQDNs
    for (const auto &name : opts.scan_fqdns) {
        if (cancelled(ctx.cancel)) {
            return fail(kCancelled);
        }

        const auto resolved = resolve_fqdns({name}, resolver_);
        int64_t since_report = 0;
        for (const auto &entry : resolved) {
            for (const auto &address : entry.addresses) {
                if (!is_valid_ipv4(address)) {
                    continue;
                }
                candidates.add(address);
                if (progress != nullptr && ++since_report >= kProgressEvery) {
                    progress->update(key, ScanPhase::RESOLVING, processed, TargetKind::FQDN, name);
                    since_report = 0;
                }
            }
        }
        ++processed;
        if (progress != nullptr) {
            progress->update(key, ScanPhase::RESOLVING, processed, TargetKind::FQDN, name);
        }
    }

    ctx.items_processed = processed;
    if (progress != nullptr && ctx.finish_progress) {
        progress->finish(key, processed, items_total, static_cast<int64_t>(out.size()));
    }

    LOG_INFO("[Reconciler] " << vendor_id << " gathered " << out.size() << " candidate(s)");
    return true;
}

ReconcileDiff Reconciler::compute_diff(const std::vector<std::string> &remote,
                                       const std::vector<std::string> &candidates) {
    ReconcileDiff diff;
    const std::unordered_set<std::string> remote_set(remote.begin(), remote.end());
    const std::unordered_set<std::string> candidate_set(candidates.begin(), candidates.end());

    OrderedSet to_add(diff.to_add);
    for (const auto &ip : candidates) {
        if (remote_set.count(ip) == 0) {
            to_add.add(ip);
        }
    }

    OrderedSet to_remove(diff.to_remove);
    for (const auto &ip : remote) {
        if (candidate_set.count(ip) == 0) {
            to_remove.add(ip);
        }
    }
    return diff;
}

bool Reconciler::reconcile(const std::string &vendor_id, const std::vector<std::string> &candidates,
                           ReconcileDiff &diff, std::string &error) {
    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        error = "unknown vendor '" + vendor_id + "'";
        return false;
    }

    std::vector<std::string> remote;
    if (!adapter->get_discovery_ips(remote)) {
        error = "remote discovery fetch failed: " + adapter->last_error();
        return false;
    }

    diff = compute_diff(remote, candidates);
    LOG_INFO("[Reconciler] " << vendor_id << " diff: +" << diff.to_add.size() << " -" << diff.to_remove.size()
                             << " (remote " << remote.size() << ", candidates " << candidates.size() << ")");
    return true;
}

std::string Reconciler::exclusivity_conflict(const std::string &ip, const std::string &vendor_id) const {
    for (const auto &owner : devices_.owners_of(ip)) {
        if (owner != vendor_id) {
            return "owned by " + owner;
        }
    }
    return std::string();
}

bool Reconciler::apply_add(const std::string &ip, const std::string &vendor_id) {
    const std::string conflict = exclusivity_conflict(ip, vendor_id);
    if (!conflict.empty()) {
        LOG_WARN("[Reconciler] Not adding " << ip << " to " << vendor_id << ": " << conflict);
        return false;
    }

    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        LOG_WARN("[Reconciler] Unknown vendor: " << vendor_id);
        return false;
    }
    return adapter->add_discovery_ips({ip});
}

bool Reconciler::apply_remove(const std::string &ip, const std::string &vendor_id) {
    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        LOG_WARN("[Reconciler] Unknown vendor: " << vendor_id);
        return false;
    }
    return adapter->remove_discovery_ips({ip});
}

void Reconciler::apply_batch(vendor::IVendorAdapter &adapter, const std::vector<std::string> &ips, bool add,
                             std::vector<ItemResult> &results) {
    std::vector<std::string> batch;
    for (const auto &ip : ips) {
        if (!is_valid_ipv4(ip)) {
            results.push_back({ip, ItemOutcome::SKIPPED, "not an IPv4 address"});
            continue;
        }
        if (add) {
            std::string conflict = exclusivity_conflict(ip, adapter.vendor_id());
            if (!conflict.empty()) {
                LOG_WARN("[Reconciler] Not adding " << ip << " to " << adapter.vendor_id() << ": " << conflict);
                results.push_back({ip, ItemOutcome::SKIPPED, std::move(conflict)});
                continue;
            }
        }
        batch.push_back(ip);
    }

    if (batch.empty()) {
        return;
    }

    const bool ok = add ? adapter.add_discovery_ips(batch) : adapter.remove_discovery_ips(batch);
    const std::string reason = ok ? std::string() : adapter.last_error();
    for (const auto &ip : batch) {
        results.push_back({ip, ok ? ItemOutcome::APPLIED : ItemOutcome::FAILED, reason});
    }
}

ReconcileSummary Reconciler::run(const std::string &vendor_id, const ScanOptions &opts,
                                 const std::string &status_key, const CancellationToken *cancel) {
    ReconcileSummary summary;
    summary.vendor_id = vendor_id;
    summary.started_at = events::now_epoch_ms();

    ProgressTracker *progress = status_key.empty() ? nullptr : progress_.get();

    ScanContext ctx;
    ctx.status_key = progress != nullptr ? &status_key : nullptr;
    ctx.cancel = cancel;
    ctx.remote_required = true;
    ctx.finish_progress = false;
    bool progress_started = false;

    auto finish = [&](const std::string &error) {
        summary.error = error;
        summary.ok = error.empty();
        summary.cancelled = error == kCancelled;
        summary.finished_at = events::now_epoch_ms();
        if (progress != nullptr) {
            if (!progress_started) {
                progress->init(status_key, 0);
            }
            if (summary.ok) {
                progress->finish(status_key, ctx.items_processed, ctx.items_total,
                                 static_cast<int64_t>(summary.candidates));
            } else {
                progress->fail(status_key, error);
            }
        }
        if (summary.ok) {
            LOG_INFO("[Reconciler] " << vendor_id << " pass complete: applied " << summary.count(ItemOutcome::APPLIED)
                                     << ", skipped " << summary.count(ItemOutcome::SKIPPED) << ", failed "
                                     << summary.count(ItemOutcome::FAILED));
        } else {
            LOG_ERROR("[Reconciler] " << vendor_id << " pass failed: " << error);
        }
        publish_completed(summary);
        return summary;
    };

    auto adapter = vendors_.get_adapter(vendor_id);
    if (!adapter) {
        return finish("unknown vendor '" + vendor_id + "'");
    }
    if (cancelled(cancel)) {
        return finish(kCancelled);
    }

    // Scanning / resolving
    std::vector<std::string> candidates;
    std::string error;
    progress_started = true;
    if (!collect(vendor_id, *adapter, opts, ctx, candidates, error)) {
        return finish(error);
    }
    summary.candidates = candidates.size();

    // Reconciling
    if (cancelled(cancel)) {
        return finish(kCancelled);
    }
    if (progress != nullptr) {
        progress->update(status_key, ScanPhase::RECONCILING, ctx.items_processed);
    }
    ReconcileDiff diff;
    if (!reconcile(vendor_id, candidates, diff, error)) {
        return finish(error);
    }
    summary.to_add = diff.to_add.size();
    summary.to_remove = diff.to_remove.size();

    if (cancelled(cancel)) {
        return finish(kCancelled);
    }
    apply_batch(*adapter, diff.to_add, true, summary.added);

    if (cancelled(cancel)) {
        return finish(kCancelled);
    }
    apply_batch(*adapter, diff.to_remove, false, summary.removed);

    return finish(std::string());
}

void Reconciler::publish_completed(const ReconcileSummary &summary) {
    if (!emitter_) {
        return;
    }

    events::ReconcileCompletedEvent event;
    event.vendor_id = summary.vendor_id;
    event.ok = summary.ok;
    for (const auto &item : summary.added) {
        event.added += item.outcome == ItemOutcome::APPLIED ? 1 : 0;
    }
    for (const auto &item : summary.removed) {
        event.removed += item.outcome == ItemOutcome::APPLIED ? 1 : 0;
    }
    event.skipped = summary.count(ItemOutcome::SKIPPED);
    event.failed = summary.count(ItemOutcome::FAILED);
    event.error = summary.error;
    event.timestamp_ms = summary.finished_at;
    emitter_->emit(event);
}

}  // namespace discovery
}  // namespace micsync
