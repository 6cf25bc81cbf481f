#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace micsync {
namespace store {

enum class StoreStatus {
    OK,
    NOT_FOUND,    // Key absent or expired
    UNAVAILABLE,  // Backend unreachable; callers choose their own fallback
};

inline const char *store_status_to_string(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK:
            return "OK";
        case StoreStatus::NOT_FOUND:
            return "NOT_FOUND";
        case StoreStatus::UNAVAILABLE:
            return "UNAVAILABLE";
        default:
            return "UNAVAILABLE";
    }
}

/**
 * @brief Shared key/value store with per-key expiry
 *
 * Used for the two cross-instance coordination points: rate-limit
 * timestamps and scan progress. Writes are last-write-wins; there is no
 * compare-and-set. A zero ttl means the entry never expires.
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual StoreStatus get(const std::string &key, nlohmann::json &value) = 0;
    virtual StoreStatus set(const std::string &key, const nlohmann::json &value, std::chrono::milliseconds ttl) = 0;
    virtual StoreStatus erase(const std::string &key) = 0;
};

}  // namespace store
}  // namespace micsync
