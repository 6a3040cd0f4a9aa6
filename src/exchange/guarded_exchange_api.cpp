/**
 * @file guarded_exchange_api.cpp
 * @brief Guarded exchange API implementation
 */

#include "exchange/guarded_exchange_api.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tradeguard {

GuardedExchangeApi::GuardedExchangeApi(std::unique_ptr<ExchangeApi> inner,
                                       std::shared_ptr<RateLimiter> limiter,
                                       std::shared_ptr<CircuitBreakerRegistry> breakers,
                                       const ApiGuardConfig& config)
    : inner_(std::move(inner))
    , limiter_(std::move(limiter))
    , breakers_(std::move(breakers))
    , config_(config) {

    if (!inner_ || !limiter_ || !breakers_) {
        throw std::invalid_argument("GuardedExchangeApi: inner API, limiter and breakers are required");
    }

    if (config_.max_retries == 0) {
        throw std::invalid_argument("GuardedExchangeApi: max_retries must be >= 1");
    }

    if (config_.retry_delay.count() < 0.0) {
        throw std::invalid_argument("GuardedExchangeApi: retry_delay must be >= 0");
    }
}

std::string GuardedExchangeApi::limit_key_for(const std::string& method) const {
    auto it = config_.method_limits.find(method);
    if (it != config_.method_limits.end()) {
        return it->second;
    }
    return DEFAULT_LIMIT_KEY;
}

ApiResponse GuardedExchangeApi::call(const std::string& method, const ApiParams& params) {
    metrics_.increment_total();

    // 1. Rate limit
    auto key = limit_key_for(method);
    if (!limiter_->limit(key, 1.0, config_.block_on_limit, config_.limit_timeout)) {
        metrics_.increment_rate_limited();
        spdlog::warn("GuardedExchangeApi: '{}' rate limited (key '{}')", method, key);

        ApiResponse response;
        response.status = CallStatus::RATE_LIMITED;
        response.message = "Rate limit exceeded for '" + key + "'";
        return response;
    }

    // 2. Circuit breaker
    auto breaker = breakers_->get_circuit_breaker(method);
    if (!breaker->allow_request()) {
        metrics_.increment_circuit_rejected();
        spdlog::warn("GuardedExchangeApi: Circuit open for '{}', request rejected", method);

        ApiResponse response;
        response.status = CallStatus::CIRCUIT_OPEN;
        response.code = SERVICE_UNAVAILABLE_CODE;
        response.message = "Service unavailable: circuit open for '" + method + "'";
        return response;
    }

    // 3. Call
    auto start = SteadyClock::now();
    auto response = call_with_retry(method, params);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start);
    metrics_.record_latency_us(static_cast<uint64_t>(elapsed.count()));

    // 4. Record outcome
    if (response.ok()) {
        breaker->record_success();
        metrics_.increment_success();
    } else {
        breaker->record_error();
        metrics_.increment_failure();
    }

    return response;
}

ApiResponse GuardedExchangeApi::call_with_retry(const std::string& method, const ApiParams& params) {
    Seconds delay = config_.retry_delay;
    ApiResponse failure;
    failure.status = CallStatus::EXCEPTION;

    for (uint32_t attempt = 1; attempt <= config_.max_retries; ++attempt) {
        try {
            auto response = inner_->call(method, params);
            response.attempts = attempt;

            if (response.code == 0) {
                response.status = CallStatus::OK;
                return response;
            }

            response.status = CallStatus::API_ERROR;
            if (is_auth_error_code(response.code)) {
                spdlog::error("GuardedExchangeApi: Authentication error on '{}' ({}): {}",
                             method, response.code, response.message);
            } else {
                spdlog::warn("GuardedExchangeApi: '{}' returned error {}: {}",
                            method, response.code, response.message);
            }
            return response;

        } catch (const ApiError& e) {
            failure.code = e.code();
            failure.message = e.what();
            failure.attempts = attempt;

            if (e.is_auth_error()) {
                spdlog::error("GuardedExchangeApi: Authentication error on '{}', not retrying: {}",
                             method, e.what());
                return failure;
            }
        } catch (const std::exception& e) {
            failure.code = 0;
            failure.message = e.what();
            failure.attempts = attempt;
        } catch (...) {
            failure.code = 0;
            failure.message = "unknown exception";
            failure.attempts = attempt;
        }

        if (attempt < config_.max_retries) {
            metrics_.increment_retries();
            spdlog::warn("GuardedExchangeApi: '{}' failed, retrying in {}s: {}",
                        method, delay.count(), failure.message);
            std::this_thread::sleep_for(delay);
            delay *= 2.0;
        }
    }

    spdlog::error("GuardedExchangeApi: '{}' failed after {} attempts: {}",
                 method, config_.max_retries, failure.message);
    return failure;
}

} // namespace tradeguard
