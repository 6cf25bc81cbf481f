#pragma once

/**
 * @file event_types.hpp
 * @brief Events fanned out by the in-process EventEmitter
 *
 * Two kinds of events flow through the emitter:
 * - ProgressUpdateEvent: a pub/sub message published on a named topic
 *   (scan progress envelopes from ProgressTracker)
 * - ReconcileCompletedEvent: one per finished reconcile pass
 *
 * Events are value types. Timestamps are epoch milliseconds.
 */

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace micsync {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Message published on a pub/sub topic
 *
 * message is the full envelope, e.g. {"type": "progress_update", "status": {...}}
 */
struct ProgressUpdateEvent {
    uint64_t event_id = 0;
    std::string topic;
    nlohmann::json message;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Summary of one reconcile pass for a vendor
 */
struct ReconcileCompletedEvent {
    uint64_t event_id = 0;
    std::string vendor_id;
    bool ok = false;
    size_t added = 0;
    size_t removed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::string error;  // Empty when ok
    int64_t timestamp_ms = 0;
};

using Event = std::variant<ProgressUpdateEvent, ReconcileCompletedEvent>;

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace micsync
