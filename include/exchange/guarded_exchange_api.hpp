/**
 * @file guarded_exchange_api.hpp
 * @brief Rate-limited, circuit-broken, retrying ExchangeApi decorator
 *
 * **Call Pipeline:**
 * 1. Resolve the limit key of the method (method_limits, else "default")
 * 2. RateLimiter::limit(key) -> RATE_LIMITED on rejection
 * 3. CircuitBreaker::allow_request() -> CIRCUIT_OPEN (code 503) on rejection
 * 4. Inner call, retried with exponential backoff on exceptions
 * 5. record_success() or record_error() on the method's breaker
 *
 * Only exceptions are retried. A response carrying a non-zero code is an
 * API error and is returned as is; authentication failures are never
 * retried, whether they arrive as a response code or as an ApiError.
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "exchange/exchange_api.hpp"
#include "metrics/api_call_metrics.hpp"
#include "resilience/circuit_breaker_registry.hpp"
#include "utils/rate_limiter.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace tradeguard {

/**
 * @brief Call guard settings
 */
struct ApiGuardConfig {
    uint32_t max_retries{3};                        ///< Attempts per call, first one included
    Seconds retry_delay{5.0};                       ///< First retry delay, doubled each retry
    std::map<std::string, std::string> method_limits; ///< Method -> rate limit key
    bool block_on_limit{true};                      ///< Wait for tokens instead of rejecting
    std::optional<Seconds> limit_timeout;           ///< Maximum token wait when blocking
};

/**
 * @brief ExchangeApi decorator applying the resilience pipeline
 *
 * The rate limiter and breaker registry are shared with the rest of the
 * client (failover health checks read them), so the guard holds them by
 * shared_ptr. The inner API is owned.
 *
 * @code
 * auto limiter = std::make_shared<RateLimiter>(config.rate_limits);
 * auto breakers = std::make_shared<CircuitBreakerRegistry>(config.circuit_breaker);
 *
 * GuardedExchangeApi api(std::make_unique<RestClient>(credentials),
 *                        limiter, breakers, config.api);
 *
 * auto response = api.call("place_order", {{"symbol", "BTCUSDT"}, {"qty", "0.01"}});
 * if (response.status == CallStatus::CIRCUIT_OPEN) {
 *     // exchange known to be failing, skip this cycle
 * }
 * @endcode
 *
 * @note Thread-safe if the inner API is
 */
class GuardedExchangeApi : public ExchangeApi {
public:
    /**
     * @brief Construct guard
     *
     * @param inner Wrapped API
     * @param limiter Shared rate limiter
     * @param breakers Shared circuit breaker registry
     * @param config Guard settings
     *
     * @throws std::invalid_argument if a pointer is null, max_retries is 0
     *         or retry_delay is negative
     */
    GuardedExchangeApi(std::unique_ptr<ExchangeApi> inner,
                       std::shared_ptr<RateLimiter> limiter,
                       std::shared_ptr<CircuitBreakerRegistry> breakers,
                       const ApiGuardConfig& config = ApiGuardConfig{});

    /**
     * @brief Run a call through the pipeline
     *
     * Never throws: exceptions of the inner API surface as
     * CallStatus::EXCEPTION with the last error message.
     */
    ApiResponse call(const std::string& method, const ApiParams& params) override;

    /**
     * @brief Rate limit key used for a method
     */
    std::string limit_key_for(const std::string& method) const;

    const ApiCallMetrics& metrics() const { return metrics_; }
    ApiCallMetrics& metrics() { return metrics_; }

    const ApiGuardConfig& config() const { return config_; }

private:
    std::unique_ptr<ExchangeApi> inner_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<CircuitBreakerRegistry> breakers_;
    const ApiGuardConfig config_;
    ApiCallMetrics metrics_;

    /**
     * @brief Call the inner API with exponential backoff on exceptions
     */
    ApiResponse call_with_retry(const std::string& method, const ApiParams& params);
};

} // namespace tradeguard
