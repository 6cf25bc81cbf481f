#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "api_error.hpp"
#include "endpoint_config.hpp"
#include "http_transport.hpp"
#include "resilience/circuit_breaker.hpp"
#include "resilience/rate_limiter.hpp"

namespace micsync {
namespace client {

struct RequestOptions {
    std::string operation;              // Rate-limit key component, e.g. "list_devices"
    double max_calls_per_second = 0.0;  // <= 0 skips the rate limiter
};

enum class HealthStatus { HEALTHY, UNHEALTHY, ERROR };

const char *health_status_to_string(HealthStatus status);

struct HealthReport {
    HealthStatus status = HealthStatus::ERROR;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json to_json() const;
};

/**
 * @brief Single logical vendor call with pooling, retry and breaker protection
 *
 * Request flow:
 *   1. Breaker refuses -> CIRCUIT_OPEN, nothing recorded, nothing sent
 *   2. Rate limiter wait (when the call carries a rate)
 *   3. Transport attempts with exponential backoff for retryable statuses
 *      and connection/timeout errors, only for retry_methods
 *   4. Final outcome classified once:
 *      2xx       breaker success, soft counter reset
 *      429       breaker failure, RATE_LIMITED with Retry-After
 *      5xx       breaker failure, API
 *      other 4xx API only (a bad request says nothing about upstream health)
 *      transport breaker failure, CONNECTION / TIMEOUT
 *      bad JSON  breaker failure, DECODE
 *
 * The soft-failure counter backs is_healthy() and never gates traffic.
 *
 * Owns exactly one CircuitBreaker; build one client per (vendor, credential set).
 */
class ResilientHttpClient {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    static constexpr int kSoftFailureLimit = 5;
    static constexpr std::chrono::milliseconds kMaxBackoff{120000};

    /**
     * @param scope Vendor id; names the breaker and scopes rate-limit keys
     * @param rate_limiter May be null (no limiting)
     * @param sleep Backoff sleeper, defaults to std::this_thread::sleep_for
     * @param breaker_clock Breaker clock, defaults to steady_clock
     */
    ResilientHttpClient(const std::string &scope, const VendorEndpointConfig &config,
                        std::shared_ptr<IHttpTransport> transport,
                        std::shared_ptr<resilience::RateLimiter> rate_limiter, SleepFn sleep = nullptr,
                        resilience::CircuitBreaker::NowFn breaker_clock = nullptr);

    ResilientHttpClient(const ResilientHttpClient &) = delete;
    ResilientHttpClient &operator=(const ResilientHttpClient &) = delete;

    ApiResult request(const std::string &method, const std::string &path,
                      const std::optional<nlohmann::json> &body = std::nullopt, const RequestOptions &options = {});

    ApiResult get(const std::string &path, const RequestOptions &options = {});
    ApiResult put(const std::string &path, const nlohmann::json &body, const RequestOptions &options = {});
    ApiResult post(const std::string &path, const nlohmann::json &body, const RequestOptions &options = {});
    ApiResult patch(const std::string &path, const nlohmann::json &body, const RequestOptions &options = {});

    // One GET to the health path: no retries, no breaker, no counter changes
    HealthReport check_health();

    bool is_healthy() const { return consecutive_soft_failures_.load() < kSoftFailureLimit; }
    int consecutive_soft_failures() const { return consecutive_soft_failures_.load(); }
    std::optional<int64_t> last_success_epoch_ms() const;

    resilience::CircuitBreaker &breaker() { return breaker_; }
    const resilience::CircuitBreaker &breaker() const { return breaker_; }

    const std::string &scope() const { return scope_; }
    const VendorEndpointConfig &config() const { return config_; }

    // Delay before retry number `attempt` (0-based), honouring Retry-After
    std::chrono::milliseconds backoff_delay(int attempt, const HttpResponse &response) const;

    // Builds the auth headers for a config ("Authorization", "x-api-key")
    static HeaderMap make_auth_headers(const VendorEndpointConfig &config);

    // Integer seconds from a Retry-After header, if present and numeric
    static std::optional<int> parse_retry_after(const HeaderMap &headers);

private:
    bool should_retry(bool method_retryable, int attempt, const HttpResponse &response) const;
    ApiResult classify(const std::string &method, const std::string &path, const HttpResponse &response);
    void record_hard_failure();
    void record_success();

    const std::string scope_;
    const VendorEndpointConfig config_;
    std::shared_ptr<IHttpTransport> transport_;
    std::shared_ptr<resilience::RateLimiter> rate_limiter_;
    SleepFn sleep_;
    resilience::CircuitBreaker breaker_;
    HeaderMap auth_headers_;

    std::atomic<int> consecutive_soft_failures_{0};
    std::atomic<int64_t> last_success_ms_{0};  // 0 = never
};

}  // namespace client
}  // namespace micsync
