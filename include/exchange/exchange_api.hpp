/**
 * @file exchange_api.hpp
 * @brief Abstract exchange REST API interface
 *
 * Every outbound call of the trading client goes through this interface:
 * the concrete client talks to the exchange, GuardedExchangeApi wraps any
 * implementation with rate limiting, circuit breaking and retries.
 *
 * **Response Codes:**
 * - 0: success
 * - 401, 10003: authentication failure (never retried)
 * - 503: synthesized locally when a circuit is open
 * - anything else: exchange error code
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace tradeguard {

/// Request parameters, name -> value
using ApiParams = std::map<std::string, std::string>;

/// HTTP unauthorized
inline constexpr int AUTH_ERROR_CODE = 401;

/// Exchange "invalid api key" code
inline constexpr int INVALID_API_KEY_CODE = 10003;

/// Code of the synthetic response for a short-circuited call
inline constexpr int SERVICE_UNAVAILABLE_CODE = 503;

/**
 * @brief Whether a response or error code means bad credentials
 */
inline bool is_auth_error_code(int code) {
    return code == AUTH_ERROR_CODE || code == INVALID_API_KEY_CODE;
}

/**
 * @brief Result of one API call
 */
struct ApiResponse {
    CallStatus status{CallStatus::OK};   ///< Outcome classification
    int code{0};                         ///< Exchange return code (0 = success)
    std::string body;                    ///< Raw response payload
    std::string message;                 ///< Exchange or local error message
    uint32_t attempts{0};                ///< Attempts made (0 if rejected locally)

    bool ok() const { return status == CallStatus::OK; }
};

/**
 * @brief Transport-level failure raised by an ExchangeApi implementation
 *
 * Carries the exchange or HTTP code when one is known, so the guard can
 * tell authentication failures (not retried) from transient ones.
 */
class ApiError : public std::runtime_error {
public:
    explicit ApiError(const std::string& what, int code = 0)
        : std::runtime_error(what)
        , code_(code) {}

    int code() const { return code_; }
    bool is_auth_error() const { return is_auth_error_code(code_); }

private:
    int code_;
};

/**
 * @brief Exchange REST API
 *
 * Implementations return a response for every answer the exchange gives,
 * including error codes, and throw (ApiError or any std::exception) only
 * when no answer was obtained.
 */
class ExchangeApi {
public:
    virtual ~ExchangeApi() = default;

    /**
     * @brief Invoke a remote method
     *
     * @param method Method name ("place_order", "get_positions", ...)
     * @param params Request parameters
     * @return ApiResponse Response
     *
     * @throws ApiError or std::exception when the call could not complete
     */
    virtual ApiResponse call(const std::string& method, const ApiParams& params) = 0;
};

} // namespace tradeguard
