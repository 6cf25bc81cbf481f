#include "in_memory_store.hpp"

#include <mutex>
#include <utility>

namespace micsync {
namespace store {

InMemoryStore::InMemoryStore() : now_([] { return Clock::now(); }) {}

InMemoryStore::InMemoryStore(NowFn now) : now_(std::move(now)) {}

StoreStatus InMemoryStore::get(const std::string &key, nlohmann::json &value) {
    if (!available_.load()) {
        return StoreStatus::UNAVAILABLE;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || expired(it->second, now_())) {
        return StoreStatus::NOT_FOUND;
    }

    value = it->second.value;
    return StoreStatus::OK;
}

StoreStatus InMemoryStore::set(const std::string &key, const nlohmann::json &value, std::chrono::milliseconds ttl) {
    if (!available_.load()) {
        return StoreStatus::UNAVAILABLE;
    }

    Entry entry;
    entry.value = value;
    entry.expires = ttl.count() > 0;
    if (entry.expires) {
        entry.expires_at = now_() + ttl;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = std::move(entry);
    return StoreStatus::OK;
}

StoreStatus InMemoryStore::erase(const std::string &key) {
    if (!available_.load()) {
        return StoreStatus::UNAVAILABLE;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return entries_.erase(key) > 0 ? StoreStatus::OK : StoreStatus::NOT_FOUND;
}

size_t InMemoryStore::purge_expired() {
    const auto now = now_();
    size_t removed = 0;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryStore::size() const {
    const auto now = now_();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t live = 0;
    for (const auto &[key, entry] : entries_) {
        static_cast<void>(key);
        if (!expired(entry, now)) {
            ++live;
        }
    }
    return live;
}

}  // namespace store
}  // namespace micsync
