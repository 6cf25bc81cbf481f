#pragma once

/**
 * @file event_emitter.hpp
 * @brief Thread-safe fan-out event dispatcher with per-subscriber queues
 *
 * Architecture:
 * - ProgressTracker publishes topic messages through the IPublisher facade
 * - DiscoveryReconciler emits one ReconcileCompletedEvent per pass
 * - Each subscriber gets its own bounded queue; overflow drops the oldest
 *   event for that subscriber only
 *
 * Thread safety:
 * - emit()/publish() may be called from any reconcile worker
 * - subscribe()/unsubscribe() from HTTP or test threads
 * - pop() from the subscriber's own thread
 */

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <deque>
#include <string>
#include <unordered_map>

#include "event_types.hpp"
#include "i_publisher.hpp"

namespace micsync {
namespace events {

/**
 * @brief Per-subscriber FIFO with a hard cap
 *
 * A full queue evicts its oldest event so a stalled subscriber only loses
 * its own backlog. close() wakes any waiting pop().
 */
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    // Never blocks. False when closed or when an older event was evicted.
    bool push(const Event &event);

    // Waits up to timeout_ms for an event; 0 only checks
    std::optional<Event> pop(int timeout_ms = 0);
    std::optional<Event> try_pop();

    size_t size() const;
    bool empty() const;
    size_t dropped_count() const;

    void close();
    bool is_closed() const;

private:
    std::optional<Event> take_front_locked();

    const size_t capacity_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> events_;
    size_t evicted_ = 0;
    bool closed_ = false;
};

/**
 * @brief Move-only handle to one subscriber queue
 *
 * Dropping the handle unsubscribes. A handle whose queue was closed by
 * EventEmitter::shutdown() keeps draining what is left.
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                 std::function<void(SubscriptionId)> unsubscribe_fn);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop();

    SubscriptionId id() const;
    bool is_active() const;
    size_t queue_size() const;
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_ = 0;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> release_;
};

/**
 * @brief Event filter for subscribers. Empty fields match everything.
 */
struct EventFilter {
    std::string topic;      // Applies to ProgressUpdateEvent only
    std::string vendor_id;  // Applies to ReconcileCompletedEvent only

    bool matches(const Event &event) const;

    static EventFilter all();
    static EventFilter for_topic(const std::string &topic);
};

/**
 * @brief Fan-out hub, also usable as the process-local IPublisher
 */
class EventEmitter : public IPublisher {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Default max events per subscriber queue
     * @param max_subscribers Maximum concurrent subscribers (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    /**
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    // Assigns a monotonic event_id and fans out to matching subscribers
    void emit(Event event);

    // Wraps the message in a ProgressUpdateEvent. Returns false after shutdown().
    bool publish(const std::string &topic, const nlohmann::json &message) override;

    // Closes all subscriber queues and rejects further publishes
    void shutdown();

    uint64_t next_event_id() const;
    size_t subscriber_count() const;
    size_t max_subscribers() const;
    bool at_capacity() const;

private:
    void unsubscribe(SubscriptionId id);

    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
        std::string name;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberInfo> subscribers_;
    std::atomic<SubscriptionId> next_subscription_id_;
    std::atomic<uint64_t> next_event_id_;
    std::atomic<bool> shut_down_{false};
};

}  // namespace events
}  // namespace micsync
