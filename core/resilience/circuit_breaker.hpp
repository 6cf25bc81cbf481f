#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace micsync {
namespace resilience {

enum class CircuitState { CLOSED, OPEN, HALF_OPEN };

const char *circuit_state_to_string(CircuitState state);

struct CircuitBreakerConfig {
    int failure_threshold = 5;                          // Consecutive failures before opening
    std::chrono::milliseconds recovery_timeout{60000};  // Open -> half-open cooldown
};

/**
 * @brief Three-state breaker guarding one upstream endpoint
 *
 * closed: requests pass, failures are counted.
 * open: requests are refused until recovery_timeout has elapsed since the
 *       failure that opened the circuit; the first check after that moves
 *       to half_open.
 * half_open: trial requests pass. A success closes the circuit and resets
 *            the counter; a failure reopens it and restarts the timer.
 *
 * A refused allow_request() never touches the failure counter.
 *
 * One instance per (vendor, credential set), owned by the client that talks
 * to that endpoint. State is per process and reset on restart.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Snapshot {
        std::string name;
        CircuitState state = CircuitState::CLOSED;
        int consecutive_failures = 0;
        int failure_threshold = 0;
        int64_t recovery_timeout_ms = 0;
        std::optional<int64_t> last_failure_ago_ms;  // nullopt until the circuit first opens
    };

    CircuitBreaker(const std::string &name, const CircuitBreakerConfig &config);
    CircuitBreaker(const std::string &name, const CircuitBreakerConfig &config, NowFn now);

    CircuitBreaker(const CircuitBreaker &) = delete;
    CircuitBreaker &operator=(const CircuitBreaker &) = delete;

    bool allow_request();
    void record_success();
    void record_failure();

    CircuitState state() const;
    int consecutive_failures() const;
    Snapshot snapshot() const;

    const std::string &name() const { return name_; }

private:
    const std::string name_;
    const CircuitBreakerConfig config_;
    NowFn now_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    int consecutive_failures_ = 0;
    std::optional<Clock::time_point> last_failure_at_;
};

}  // namespace resilience
}  // namespace micsync
