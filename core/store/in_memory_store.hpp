#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "kv_store.hpp"

namespace micsync {
namespace store {

/**
 * @brief Process-local IKeyValueStore
 *
 * Expired entries are invisible to get() and are dropped lazily on the next
 * write to the same key or by purge_expired(). The availability switch lets
 * the fail-open paths of callers be exercised without a real backend.
 */
class InMemoryStore : public IKeyValueStore {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    InMemoryStore();
    explicit InMemoryStore(NowFn now);

    InMemoryStore(const InMemoryStore &) = delete;
    InMemoryStore &operator=(const InMemoryStore &) = delete;

    StoreStatus get(const std::string &key, nlohmann::json &value) override;
    StoreStatus set(const std::string &key, const nlohmann::json &value, std::chrono::milliseconds ttl) override;
    StoreStatus erase(const std::string &key) override;

    // Removes expired entries, returns how many were dropped
    size_t purge_expired();

    // Live (non-expired) entry count
    size_t size() const;

    void set_available(bool available) { available_.store(available); }
    bool is_available() const { return available_.load(); }

private:
    struct Entry {
        nlohmann::json value;
        Clock::time_point expires_at;
        bool expires = false;
    };

    bool expired(const Entry &entry, Clock::time_point now) const { return entry.expires && now >= entry.expires_at; }

    NowFn now_;
    std::atomic<bool> available_{true};

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace store
}  // namespace micsync
