/**
 * @file types.hpp
 * @brief Core enumerations and clock aliases for the resilience layer
 *
 * Defines the state enumerations shared by the circuit breakers, the
 * failover manager and the guarded API client, together with the clock
 * and duration aliases used for every timeout in the library.
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tradeguard {

/// Monotonic clock used for refill, timeout and backoff arithmetic
using SteadyClock = std::chrono::steady_clock;

/// Wall clock used for timestamps exported to monitoring
using SystemClock = std::chrono::system_clock;

/// Fractional seconds, the unit of every configured interval
using Seconds = std::chrono::duration<double>;

/**
 * @brief Circuit breaker state
 *
 * CLOSED passes every request, OPEN rejects every request until the
 * circuit timeout elapses, HALF_OPEN lets a probe request through.
 */
enum class CircuitState : uint8_t {
    CLOSED = 0,     ///< Normal operation
    OPEN = 1,       ///< Tripped, requests short-circuited
    HALF_OPEN = 2   ///< Probing whether the dependency recovered
};

/**
 * @brief Health classification of a supervised component
 */
enum class ComponentStatus : uint8_t {
    HEALTHY = 0,     ///< Working normally
    WARNING = 1,     ///< Working, but degraded
    CRITICAL = 2,    ///< Not usable
    FAILED = 3,      ///< Health check or recovery failed
    RECOVERING = 4   ///< Recovery in progress
};

/**
 * @brief Global state derived by the failover manager
 */
enum class FailoverState : uint8_t {
    NORMAL = 0,     ///< All components healthy
    DEGRADED = 1,   ///< At least one component in WARNING
    FAILOVER = 2,   ///< Running on backup systems
    RECOVERY = 3,   ///< At least one component recovering
    EMERGENCY = 4   ///< A critical component is CRITICAL or FAILED
};

/**
 * @brief Outcome of a guarded exchange API call
 */
enum class CallStatus : uint8_t {
    OK = 0,             ///< Call succeeded
    API_ERROR = 1,      ///< Remote returned an error code
    RATE_LIMITED = 2,   ///< Rejected locally by the rate limiter
    CIRCUIT_OPEN = 3,   ///< Rejected locally by an open circuit
    EXCEPTION = 4       ///< Remote call threw on every attempt
};

/**
 * @brief Convert circuit state to string
 *
 * @param state Circuit state
 * @return const char* Upper-case state name ("CLOSED", "OPEN", "HALF_OPEN")
 */
inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Convert component status to string
 */
inline const char* component_status_to_string(ComponentStatus status) {
    switch (status) {
        case ComponentStatus::HEALTHY: return "HEALTHY";
        case ComponentStatus::WARNING: return "WARNING";
        case ComponentStatus::CRITICAL: return "CRITICAL";
        case ComponentStatus::FAILED: return "FAILED";
        case ComponentStatus::RECOVERING: return "RECOVERING";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Convert failover state to string
 */
inline const char* failover_state_to_string(FailoverState state) {
    switch (state) {
        case FailoverState::NORMAL: return "NORMAL";
        case FailoverState::DEGRADED: return "DEGRADED";
        case FailoverState::FAILOVER: return "FAILOVER";
        case FailoverState::RECOVERY: return "RECOVERY";
        case FailoverState::EMERGENCY: return "EMERGENCY";
        default: return "UNKNOWN";
    }
}

inline const char* call_status_to_string(CallStatus status) {
    switch (status) {
        case CallStatus::OK: return "OK";
        case CallStatus::API_ERROR: return "API_ERROR";
        case CallStatus::RATE_LIMITED: return "RATE_LIMITED";
        case CallStatus::CIRCUIT_OPEN: return "CIRCUIT_OPEN";
        case CallStatus::EXCEPTION: return "EXCEPTION";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Names of the supervised components
 *
 * The failover manager registers exactly these five components at
 * construction. The first, fourth and fifth are critical.
 */
namespace component {
inline constexpr const char* API_CLIENT = "api_client";           ///< Exchange REST client (critical)
inline constexpr const char* DATA_STREAM = "data_stream";         ///< Market data stream
inline constexpr const char* PERSISTENCE = "persistence";         ///< Metrics/trade persistence
inline constexpr const char* STRATEGY_ENGINE = "strategy_engine"; ///< Signal generation (critical)
inline constexpr const char* ORDER_ENGINE = "order_engine";       ///< Order placement (critical)
} // namespace component

} // namespace tradeguard
