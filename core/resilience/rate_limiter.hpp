#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "store/kv_store.hpp"

namespace micsync {
namespace resilience {

/**
 * @brief Minimum-interval limiter keyed by (scope, operation)
 *
 * The last call time for each key lives in the shared store so that
 * separate instances (and processes) sharing that store space their calls
 * out. Within one process, callers on the same key are served in arrival
 * order; callers on different keys never wait on each other.
 *
 * If the store is unavailable the call proceeds immediately and nothing is
 * recorded (fail open).
 */
class RateLimiter {
public:
    using SleepFn = std::function<void(std::chrono::microseconds)>;
    using WallClockFn = std::function<int64_t()>;  // Epoch microseconds

    static constexpr std::chrono::milliseconds kDefaultEntryTtl{60000};

    explicit RateLimiter(std::shared_ptr<store::IKeyValueStore> store,
                         std::chrono::milliseconds entry_ttl = kDefaultEntryTtl);
    RateLimiter(std::shared_ptr<store::IKeyValueStore> store, std::chrono::milliseconds entry_ttl, WallClockFn now,
                SleepFn sleep);

    RateLimiter(const RateLimiter &) = delete;
    RateLimiter &operator=(const RateLimiter &) = delete;

    // Blocks until the key's minimum interval has passed, then records now.
    // max_calls_per_second <= 0 disables limiting for this call.
    void acquire(const std::string &scope, const std::string &operation, double max_calls_per_second);

    // Store key for a (scope, operation) pair
    static std::string make_key(const std::string &scope, const std::string &operation);

    // Number of acquires that ran without limiting because the store was down
    uint64_t fail_open_count() const { return fail_open_count_.load(); }

private:
    // Per-key ticket gate: tickets are handed out in arrival order and only
    // the ticket being served may touch the store entry for that key.
    struct KeyGate {
        std::mutex mutex;
        std::condition_variable cv;
        uint64_t next_ticket = 0;
        uint64_t now_serving = 0;
        size_t users = 0;
    };

    std::shared_ptr<KeyGate> checkout_gate(const std::string &key);
    void release_gate(const std::string &key, const std::shared_ptr<KeyGate> &gate);

    void wait_for_slot(const std::string &key, std::chrono::microseconds min_interval);
    void note_fail_open(const std::string &key);

    std::shared_ptr<store::IKeyValueStore> store_;
    const std::chrono::milliseconds entry_ttl_;
    WallClockFn now_;
    SleepFn sleep_;

    std::mutex gates_mutex_;
    std::unordered_map<std::string, std::shared_ptr<KeyGate>> gates_;

    std::atomic<uint64_t> fail_open_count_{0};
};

}  // namespace resilience
}  // namespace micsync
