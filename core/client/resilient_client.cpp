#include "resilient_client.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <thread>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace micsync {
namespace client {

namespace {

constexpr size_t kMaxBodyInError = 200;

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string base64_encode(const std::string &input) {
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char *>(input.data()),
                                        static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(written));
}

std::string body_excerpt(const std::string &body) {
    if (body.size() <= kMaxBodyInError) {
        return body;
    }
    return body.substr(0, kMaxBodyInError) + "...";
}

bool is_blank(const std::string &s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

ApiResult make_error(ErrorKind kind, int status_code, const std::string &message) {
    ApiResult result;
    ApiError error;
    error.kind = kind;
    error.status_code = status_code;
    error.message = message;
    result.error = error;
    return result;
}

}  // namespace

const char *health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:
            return "healthy";
        case HealthStatus::UNHEALTHY:
            return "unhealthy";
        case HealthStatus::ERROR:
            return "error";
        default:
            return "error";
    }
}

nlohmann::json HealthReport::to_json() const {
    return {{"status", health_status_to_string(status)}, {"details", details}};
}

ResilientHttpClient::ResilientHttpClient(const std::string &scope, const VendorEndpointConfig &config,
                                         std::shared_ptr<IHttpTransport> transport,
                                         std::shared_ptr<resilience::RateLimiter> rate_limiter, SleepFn sleep,
                                         resilience::CircuitBreaker::NowFn breaker_clock)
    : scope_(scope),
      config_(config),
      transport_(std::move(transport)),
      rate_limiter_(std::move(rate_limiter)),
      sleep_(sleep ? std::move(sleep)
                   : SleepFn([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })),
      breaker_(scope,
               resilience::CircuitBreakerConfig{config.failure_threshold,
                                                std::chrono::milliseconds(config.recovery_timeout_ms)},
               breaker_clock ? std::move(breaker_clock)
                             : resilience::CircuitBreaker::NowFn(
                                   [] { return resilience::CircuitBreaker::Clock::now(); })),
      auth_headers_(make_auth_headers(config)) {}

HeaderMap ResilientHttpClient::make_auth_headers(const VendorEndpointConfig &config) {
    HeaderMap headers;
    switch (config.auth_scheme) {
        case AuthScheme::API_KEY:
            if (!config.credentials.api_key.empty()) {
                headers["Authorization"] = "Bearer " + config.credentials.api_key;
                headers["x-api-key"] = config.credentials.api_key;
            }
            break;
        case AuthScheme::BASIC:
            if (!config.credentials.username.empty()) {
                headers["Authorization"] =
                    "Basic " + base64_encode(config.credentials.username + ":" + config.credentials.password);
            }
            break;
        case AuthScheme::NONE:
        default:
            break;
    }
    headers["Accept"] = "application/json";
    return headers;
}

std::optional<int> ResilientHttpClient::parse_retry_after(const HeaderMap &headers) {
    auto it = headers.find("Retry-After");
    if (it == headers.end() || it->second.empty()) {
        return std::nullopt;
    }

    const char *begin = it->second.c_str();
    char *end = nullptr;
    const long value = std::strtol(begin, &end, 10);
    if (end == begin || value < 0) {
        // HTTP-date form is not used by the vendor APIs
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<int64_t> ResilientHttpClient::last_success_epoch_ms() const {
    const int64_t ms = last_success_ms_.load();
    if (ms == 0) {
        return std::nullopt;
    }
    return ms;
}

std::chrono::milliseconds ResilientHttpClient::backoff_delay(int attempt, const HttpResponse &response) const {
    const double seconds = config_.backoff_factor * std::pow(2.0, attempt);
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));

    if (response.error == TransportError::NONE && (response.status == 429 || response.status == 503)) {
        if (auto retry_after = parse_retry_after(response.headers)) {
            delay = std::max(delay, std::chrono::milliseconds(static_cast<int64_t>(*retry_after) * 1000));
        }
    }

    return std::min(delay, kMaxBackoff);
}

bool ResilientHttpClient::should_retry(bool method_retryable, int attempt, const HttpResponse &response) const {
    if (!method_retryable || attempt >= config_.max_retries) {
        return false;
    }

    switch (response.error) {
        case TransportError::CONNECTION:
        case TransportError::TIMEOUT:
            return true;
        case TransportError::NONE:
            return config_.retryable_status_codes.count(response.status) > 0;
        default:
            return false;
    }
}

ApiResult ResilientHttpClient::request(const std::string &method, const std::string &path,
                                       const std::optional<nlohmann::json> &body, const RequestOptions &options) {
    if (!breaker_.allow_request()) {
        LOG_DEBUG("[HttpClient] " << scope_ << " circuit open, refusing " << method << " " << path);
        return make_error(ErrorKind::CIRCUIT_OPEN, 0, "circuit open for " + scope_);
    }

    if (rate_limiter_ && options.max_calls_per_second > 0.0) {
        const std::string operation = options.operation.empty() ? path : options.operation;
        rate_limiter_->acquire(scope_, operation, options.max_calls_per_second);
    }

    HttpRequest req;
    req.method = to_upper(method);
    req.path = path;
    req.headers = auth_headers_;
    if (body) {
        req.body = body->dump();
    }

    const bool method_retryable = config_.retry_methods.count(req.method) > 0;

    HttpResponse response;
    for (int attempt = 0;; ++attempt) {
        response = transport_->send(req);

        if (!should_retry(method_retryable, attempt, response)) {
            break;
        }

        const auto delay = backoff_delay(attempt, response);
        if (response.error == TransportError::NONE) {
            LOG_WARN("[HttpClient] " << scope_ << " " << req.method << " " << path << " returned " << response.status
                                     << ", retry " << (attempt + 1) << "/" << config_.max_retries << " in "
                                     << delay.count() << "ms");
        } else {
            LOG_WARN("[HttpClient] " << scope_ << " " << req.method << " " << path << " "
                                     << transport_error_to_string(response.error) << " error ("
                                     << response.error_message << "), retry " << (attempt + 1) << "/"
                                     << config_.max_retries << " in " << delay.count() << "ms");
        }
        sleep_(delay);
    }

    return classify(req.method, path, response);
}

ApiResult ResilientHttpClient::get(const std::string &path, const RequestOptions &options) {
    return request("GET", path, std::nullopt, options);
}

ApiResult ResilientHttpClient::put(const std::string &path, const nlohmann::json &body, const RequestOptions &options) {
    return request("PUT", path, body, options);
}

ApiResult ResilientHttpClient::post(const std::string &path, const nlohmann::json &body,
                                    const RequestOptions &options) {
    return request("POST", path, body, options);
}

ApiResult ResilientHttpClient::patch(const std::string &path, const nlohmann::json &body,
                                     const RequestOptions &options) {
    return request("PATCH", path, body, options);
}

void ResilientHttpClient::record_hard_failure() {
    breaker_.record_failure();
    consecutive_soft_failures_++;
}

void ResilientHttpClient::record_success() {
    breaker_.record_success();
    consecutive_soft_failures_.store(0);
    last_success_ms_.store(now_epoch_ms());
}

ApiResult ResilientHttpClient::classify(const std::string &method, const std::string &path,
                                        const HttpResponse &response) {
    const std::string target = method + " " + transport_->base_url() + path;

    if (response.error == TransportError::TIMEOUT) {
        record_hard_failure();
        LOG_ERROR("[HttpClient] Timeout: " << target << " - " << response.error_message);
        return make_error(ErrorKind::TIMEOUT, 0, response.error_message);
    }

    if (response.error != TransportError::NONE) {
        record_hard_failure();
        LOG_ERROR("[HttpClient] Connection error: " << target << " - " << response.error_message);
        return make_error(ErrorKind::CONNECTION, 0, response.error_message);
    }

    const int status = response.status;

    if (status >= 200 && status < 300) {
        ApiResult result;
        if (!is_blank(response.body)) {
            try {
                result.body = nlohmann::json::parse(response.body);
            } catch (const nlohmann::json::parse_error &e) {
                record_hard_failure();
                LOG_ERROR("[HttpClient] Invalid JSON from " << target << ": " << e.what());
                return make_error(ErrorKind::DECODE, status, std::string("invalid JSON: ") + e.what());
            }
        }
        record_success();
        LOG_DEBUG("[HttpClient] " << target << " -> " << status);
        return result;
    }

    if (status == 429) {
        record_hard_failure();
        ApiResult result = make_error(ErrorKind::RATE_LIMITED, status, "rate limited");
        result.error->retry_after_s = parse_retry_after(response.headers);
        LOG_WARN("[HttpClient] Rate limited: " << target << " (retry after "
                                               << result.error->retry_after_s.value_or(-1) << "s)");
        return result;
    }

    if (status >= 500) {
        record_hard_failure();
        LOG_ERROR("[HttpClient] Server error " << status << ": " << target << " - " << body_excerpt(response.body));
        return make_error(ErrorKind::API, status, body_excerpt(response.body));
    }

    // Client errors leave breaker and health untouched
    if (status == 401 || status == 403) {
        LOG_ERROR("[HttpClient] Authentication failed (" << status << "): " << target);
    } else {
        LOG_WARN("[HttpClient] Client error " << status << ": " << target << " - " << body_excerpt(response.body));
    }
    return make_error(ErrorKind::API, status, body_excerpt(response.body));
}

HealthReport ResilientHttpClient::check_health() {
    HealthReport report;
    report.details["base_url"] = transport_->base_url();
    report.details["consecutive_failures"] = consecutive_soft_failures_.load();
    report.details["circuit_state"] = resilience::circuit_state_to_string(breaker_.state());
    if (auto last = last_success_epoch_ms()) {
        report.details["last_successful_request_ms"] = *last;
    } else {
        report.details["last_successful_request_ms"] = nullptr;
    }

    HttpRequest req;
    req.method = "GET";
    req.path = config_.health_path;
    req.headers = auth_headers_;

    const HttpResponse response = transport_->send(req);

    if (response.error != TransportError::NONE) {
        report.status = HealthStatus::ERROR;
        report.details["error"] = response.error_message;
        LOG_WARN("[HttpClient] " << scope_ << " health check unreachable: " << response.error_message);
        return report;
    }

    report.details["status_code"] = response.status;
    if (response.status == 200) {
        report.status = HealthStatus::HEALTHY;
    } else {
        report.status = HealthStatus::UNHEALTHY;
        LOG_WARN("[HttpClient] " << scope_ << " health check returned " << response.status);
    }
    return report;
}

}  // namespace client
}  // namespace micsync
