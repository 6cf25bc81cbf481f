#include "circuit_breaker.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace micsync {
namespace resilience {

const char *circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED:
            return "closed";
        case CircuitState::OPEN:
            return "open";
        case CircuitState::HALF_OPEN:
            return "half_open";
        default:
            return "closed";
    }
}

CircuitBreaker::CircuitBreaker(const std::string &name, const CircuitBreakerConfig &config)
    : CircuitBreaker(name, config, [] { return Clock::now(); }) {}

CircuitBreaker::CircuitBreaker(const std::string &name, const CircuitBreakerConfig &config, NowFn now)
    : name_(name), config_(config), now_(std::move(now)) {}

bool CircuitBreaker::allow_request() {
    bool transitioned = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != CircuitState::OPEN) {
            return true;
        }

        // An open circuit always carries the time it opened
        const auto elapsed = now_() - last_failure_at_.value_or(Clock::time_point{});
        if (elapsed <= config_.recovery_timeout) {
            return false;
        }

        state_ = CircuitState::HALF_OPEN;
        transitioned = true;
    }

    if (transitioned) {
        LOG_INFO("[CircuitBreaker] " << name_ << " half-open, allowing trial request");
    }
    return true;
}

void CircuitBreaker::record_success() {
    CircuitState previous;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        consecutive_failures_ = 0;
        state_ = CircuitState::CLOSED;
    }

    if (previous != CircuitState::CLOSED) {
        LOG_INFO("[CircuitBreaker] " << name_ << " closed after successful request");
    }
}

void CircuitBreaker::record_failure() {
    bool opened = false;
    int failures = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_failures_++;
        failures = consecutive_failures_;

        if (consecutive_failures_ >= config_.failure_threshold) {
            opened = state_ != CircuitState::OPEN;
            state_ = CircuitState::OPEN;
            last_failure_at_ = now_();
        }
    }

    if (opened) {
        LOG_WARN("[CircuitBreaker] " << name_ << " opened after " << failures << " consecutive failures (cooldown "
                                     << config_.recovery_timeout.count() << "ms)");
    } else {
        LOG_DEBUG("[CircuitBreaker] " << name_ << " failure " << failures << "/" << config_.failure_threshold);
    }
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    Snapshot snap;
    snap.name = name_;
    snap.failure_threshold = config_.failure_threshold;
    snap.recovery_timeout_ms = config_.recovery_timeout.count();

    std::lock_guard<std::mutex> lock(mutex_);
    snap.state = state_;
    snap.consecutive_failures = consecutive_failures_;
    if (last_failure_at_) {
        snap.last_failure_ago_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now_() - *last_failure_at_).count();
    }
    return snap;
}

}  // namespace resilience
}  // namespace micsync
