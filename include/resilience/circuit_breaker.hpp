/**
 * @file circuit_breaker.hpp
 * @brief Per-operation circuit breaker
 *
 * Tracks failures of one remote operation and short-circuits calls while
 * the operation is known to be failing.
 *
 * **State Machine:**
 * - CLOSED: every request passes; errors are counted, and the count is
 *   forgiven if no error occurred within error_timeout. Reaching
 *   error_threshold opens the circuit.
 * - OPEN: requests are rejected until circuit_timeout has elapsed, then
 *   the circuit moves to HALF_OPEN and the next request is the probe.
 *   Errors and successes reported while OPEN are ignored.
 * - HALF_OPEN: a success closes the circuit, an error reopens it
 *   immediately regardless of the threshold.
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tradeguard {

/**
 * @brief Circuit breaker thresholds
 */
struct CircuitBreakerConfig {
    uint32_t error_threshold{5};      ///< Errors before opening
    Seconds error_timeout{60.0};      ///< Idle time after which the error count resets
    Seconds circuit_timeout{300.0};   ///< Time spent OPEN before probing
    bool single_probe{true};          ///< Admit one in-flight probe while HALF_OPEN
};

/**
 * @brief Validate breaker thresholds
 *
 * @param config Thresholds to check
 *
 * @throws std::invalid_argument if error_threshold is 0 or a timeout
 *         is negative
 */
void validate_circuit_breaker_config(const CircuitBreakerConfig& config);

/**
 * @brief Point-in-time view of a breaker
 */
struct CircuitBreakerSnapshot {
    std::string name;                       ///< Operation name
    CircuitState state{CircuitState::CLOSED};
    uint32_t error_count{0};                ///< Errors in the current window
    double seconds_since_open{0.0};         ///< 0 unless OPEN or HALF_OPEN
};

/**
 * @brief Circuit breaker for one remote operation
 *
 * With single_probe enabled (the default) only the caller whose
 * allow_request() moved the circuit to HALF_OPEN is admitted; concurrent
 * callers are rejected until that probe reports its outcome. A probe that
 * never reports is abandoned after circuit_timeout and a new one is
 * admitted. With single_probe disabled every HALF_OPEN request passes.
 *
 * @code
 * CircuitBreaker breaker("get_positions", config);
 *
 * if (!breaker.allow_request()) {
 *     return service_unavailable();
 * }
 *
 * auto response = api.call("get_positions", params);
 * if (response.ok()) {
 *     breaker.record_success();
 * } else {
 *     breaker.record_error();
 * }
 * @endcode
 *
 * @note Thread-safe, one mutex per breaker
 */
class CircuitBreaker {
public:
    /**
     * @brief Construct breaker in CLOSED state
     *
     * @param name Operation name
     * @param config Thresholds
     *
     * @throws std::invalid_argument if error_threshold is 0 or a timeout
     *         is negative
     */
    CircuitBreaker(std::string name, const CircuitBreakerConfig& config = CircuitBreakerConfig{});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Ask whether a request may be sent
     *
     * @return bool True if the caller may proceed
     */
    bool allow_request();

    /**
     * @brief Report a successful call
     *
     * Closes the circuit if HALF_OPEN, otherwise no effect.
     */
    void record_success();

    /**
     * @brief Report a failed call
     *
     * @see file header for per-state behaviour
     */
    void record_error();

    /**
     * @brief Force CLOSED with all counters cleared
     */
    void reset();

    CircuitState get_state() const;
    uint32_t get_error_count() const;
    CircuitBreakerSnapshot get_snapshot() const;

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    const std::string name_;
    const CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::CLOSED};
    uint32_t error_count_{0};
    std::optional<SteadyClock::time_point> last_error_time_;
    SteadyClock::time_point open_time_{};
    bool probe_in_flight_{false};
    SteadyClock::time_point probe_start_time_{};

    // Caller must hold mutex_
    void open_circuit(SteadyClock::time_point now);
    void close_circuit();
};

} // namespace tradeguard
