#include "event_emitter.hpp"

#include <chrono>
#include <type_traits>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace micsync {
namespace events {

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name)
    : capacity_(max_size > 0 ? max_size : 1), name_(name) {}

bool SubscriberQueue::push(const Event &event) {
    size_t evicted_total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            evicted_total = ++evicted_;
        }
        events_.push_back(event);
    }
    ready_.notify_one();

    // First eviction, then every 100th
    if (evicted_total % 100 == 1) {
        LOG_WARN("[EventEmitter] Subscriber '" << name_ << "' is behind, " << evicted_total
                                               << " event(s) evicted so far");
    }
    return evicted_total == 0;
}

std::optional<Event> SubscriberQueue::take_front_locked() {
    if (events_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms > 0) {
        ready_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !events_.empty(); });
    }
    return take_front_locked();
}

std::optional<Event> SubscriberQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_front_locked();
}

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool SubscriberQueue::empty() const { return size() == 0; }

size_t SubscriberQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool SubscriberQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), release_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(std::exchange(other.id_, 0)), queue_(std::move(other.queue_)), release_(std::move(other.release_)) {}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    unsubscribe();
    id_ = std::exchange(other.id_, 0);
    queue_ = std::move(other.queue_);
    release_ = std::move(other.release_);
    return *this;
}

std::optional<Event> Subscription::pop(int timeout_ms) {
    return queue_ ? queue_->pop(timeout_ms) : std::nullopt;
}

std::optional<Event> Subscription::try_pop() { return queue_ ? queue_->try_pop() : std::nullopt; }

Subscription::SubscriptionId Subscription::id() const { return id_; }

bool Subscription::is_active() const { return queue_ && !queue_->is_closed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

size_t Subscription::dropped_count() const { return queue_ ? queue_->dropped_count() : 0; }

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (release_) {
        release_(id_);
    }
    if (queue_) {
        queue_->close();
    }
    id_ = 0;
}

bool EventFilter::matches(const Event &event) const {
    return std::visit(
        [this](auto &&e) -> bool {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ProgressUpdateEvent>) {
                if (!topic.empty() && e.topic != topic) {
                    return false;
                }
                // Vendor filter narrows to reconcile events only
                return vendor_id.empty();
            } else {
                if (!vendor_id.empty() && e.vendor_id != vendor_id) {
                    return false;
                }
                return topic.empty();
            }
        },
        event);
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventFilter EventFilter::for_topic(const std::string &topic) {
    EventFilter filter;
    filter.topic = topic;
    return filter;
}

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      next_subscription_id_(1),
      next_event_id_(1) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    const size_t capacity = queue_size > 0 ? queue_size : default_queue_size_;
    auto queue = std::make_shared<SubscriberQueue>(capacity, name);

    SubscriptionId id = 0;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_subscribers_ == 0 || subscribers_.size() < max_subscribers_) {
            id = next_subscription_id_++;
            subscribers_.emplace(id, SubscriberInfo{queue, filter, name});
            total = subscribers_.size();
        }
    }

    if (id == 0) {
        LOG_WARN("[EventEmitter] Subscriber limit " << max_subscribers_ << " reached, refusing '" << name << "'");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] Subscriber " << id << (name.empty() ? "" : " '" + name + "'") << " added (" << total
                                           << " active)");
    return std::make_unique<Subscription>(id, std::move(queue), [this](SubscriptionId sub) { unsubscribe(sub); });
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<SubscriberQueue>> targets;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        const uint64_t id = next_event_id_++;
        std::visit([id](auto &&e) { e.event_id = id; }, event);

        for (auto &[sub_id, info] : subscribers_) {
            static_cast<void>(sub_id);
            if (info.filter.matches(event)) {
                targets.push_back(info.queue);
            }
        }
    }

    for (auto &queue : targets) {
        queue->push(event);
    }
}

bool EventEmitter::publish(const std::string &topic, const nlohmann::json &message) {
    if (shut_down_.load()) {
        return false;
    }

    ProgressUpdateEvent event;
    event.topic = topic;
    event.message = message;
    event.timestamp_ms = now_epoch_ms();
    emit(std::move(event));
    return true;
}

void EventEmitter::shutdown() {
    shut_down_.store(true);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[sub_id, info] : subscribers_) {
        static_cast<void>(sub_id);
        info.queue->close();
    }
}

uint64_t EventEmitter::next_event_id() const { return next_event_id_.load(); }

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

size_t EventEmitter::max_subscribers() const { return max_subscribers_; }

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && subscribers_.size() >= max_subscribers_;
}

void EventEmitter::unsubscribe(SubscriptionId id) {
    std::shared_ptr<SubscriberQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        queue = std::move(it->second.queue);
        subscribers_.erase(it);
    }
    queue->close();
    LOG_DEBUG("[EventEmitter] Subscriber " << id << " removed");
}

}  // namespace events
}  // namespace micsync
