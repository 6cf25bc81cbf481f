#include "rate_limiter.hpp"

#include <thread>
#include <utility>

#include "logging/logger.hpp"

namespace micsync {
namespace resilience {

namespace {

int64_t system_now_us() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Entry layout: {"last_call_at_us": int, "min_interval_us": int}
bool read_last_call(const nlohmann::json &entry, int64_t &last_call_us) {
    if (!entry.is_object() || !entry.contains("last_call_at_us") ||
        !entry["last_call_at_us"].is_number_integer()) {
        return false;
    }
    last_call_us = entry["last_call_at_us"].get<int64_t>();
    return true;
}

}  // namespace

RateLimiter::RateLimiter(std::shared_ptr<store::IKeyValueStore> store, std::chrono::milliseconds entry_ttl)
    : RateLimiter(std::move(store), entry_ttl, system_now_us,
                  [](std::chrono::microseconds d) { std::this_thread::sleep_for(d); }) {}

RateLimiter::RateLimiter(std::shared_ptr<store::IKeyValueStore> store, std::chrono::milliseconds entry_ttl,
                         WallClockFn now, SleepFn sleep)
    : store_(std::move(store)), entry_ttl_(entry_ttl), now_(std::move(now)), sleep_(std::move(sleep)) {}

std::string RateLimiter::make_key(const std::string &scope, const std::string &operation) {
    return "rate_limit:" + scope + ":" + operation;
}

void RateLimiter::acquire(const std::string &scope, const std::string &operation, double max_calls_per_second) {
    if (max_calls_per_second <= 0.0) {
        return;
    }

    const auto min_interval = std::chrono::microseconds(static_cast<int64_t>(1000000.0 / max_calls_per_second));
    const std::string key = make_key(scope, operation);

    auto gate = checkout_gate(key);

    uint64_t ticket;
    {
        std::unique_lock<std::mutex> lock(gate->mutex);
        ticket = gate->next_ticket++;
        gate->cv.wait(lock, [&] { return gate->now_serving == ticket; });
    }

    wait_for_slot(key, min_interval);

    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        gate->now_serving++;
    }
    gate->cv.notify_all();

    release_gate(key, gate);
}

void RateLimiter::wait_for_slot(const std::string &key, std::chrono::microseconds min_interval) {
    for (;;) {
        nlohmann::json entry;
        const auto status = store_->get(key, entry);

        if (status == store::StoreStatus::UNAVAILABLE) {
            note_fail_open(key);
            return;
        }

        int64_t last_call_us = 0;
        if (status == store::StoreStatus::OK && read_last_call(entry, last_call_us)) {
            const int64_t elapsed = now_() - last_call_us;
            if (elapsed < min_interval.count()) {
                // A last_call in the future (clock step) still waits at most one interval
                int64_t remaining = min_interval.count() - elapsed;
                if (remaining > min_interval.count()) {
                    remaining = min_interval.count();
                }
                LOG_DEBUG("[RateLimiter] " << key << " waiting " << remaining / 1000 << "ms");
                sleep_(std::chrono::microseconds(remaining));
                // Re-read: another instance may have called in the meantime
                continue;
            }
        }

        nlohmann::json updated = {{"last_call_at_us", now_()}, {"min_interval_us", min_interval.count()}};
        if (store_->set(key, updated, entry_ttl_) == store::StoreStatus::UNAVAILABLE) {
            note_fail_open(key);
        }
        return;
    }
}

void RateLimiter::note_fail_open(const std::string &key) {
    const uint64_t count = ++fail_open_count_;
    if (count % 100 == 1) {
        LOG_WARN("[RateLimiter] Store unavailable, not limiting " << key << " (" << count << " unlimited calls)");
    }
}

std::shared_ptr<RateLimiter::KeyGate> RateLimiter::checkout_gate(const std::string &key) {
    std::lock_guard<std::mutex> lock(gates_mutex_);
    auto &gate = gates_[key];
    if (!gate) {
        gate = std::make_shared<KeyGate>();
    }
    gate->users++;
    return gate;
}

void RateLimiter::release_gate(const std::string &key, const std::shared_ptr<KeyGate> &gate) {
    std::lock_guard<std::mutex> lock(gates_mutex_);
    if (--gate->users == 0) {
        gates_.erase(key);
    }
}

}  // namespace resilience
}  // namespace micsync
