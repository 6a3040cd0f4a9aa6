/**
 * @file health_checks.hpp
 * @brief Health check factories for the supervised components
 *
 * Builds the HealthCheckFn collaborators registered with FailoverManager
 * from small owner-supplied probes. Every check returned here:
 * - returns FAILED if a required probe is missing
 * - returns FAILED (and logs) if a probe throws
 *
 * **Classification:**
 * | Component       | CRITICAL              | WARNING                        |
 * |-----------------|-----------------------|--------------------------------|
 * | api_client      | no server time        | any circuit breaker OPEN       |
 * | data_stream     | stream unhealthy      | no message for max_silence     |
 * | strategy_engine | -                     | no signal for max_signal_age   |
 * | order_engine    | cannot place orders   | -                              |
 * | persistence     | -                     | ping returns false             |
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "failover/failover_manager.hpp"
#include "resilience/circuit_breaker_registry.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace tradeguard {

/// Returns exchange server time in ms, or nothing if the exchange did not answer
using ServerTimeProbe = std::function<std::optional<int64_t>()>;

/// Returns the time of the last event, or nothing if none was seen yet
using LastEventProbe = std::function<std::optional<SystemClock::time_point>()>;

/// Yes/no probe
using BoolProbe = std::function<bool()>;

/// Default data stream silence before WARNING
inline constexpr double DEFAULT_MAX_STREAM_SILENCE_SECONDS = 60.0;

/// Default strategy signal age before WARNING
inline constexpr double DEFAULT_MAX_SIGNAL_AGE_SECONDS = 3600.0;

/**
 * @brief Probes of the market data stream
 */
struct DataStreamProbes {
    BoolProbe enabled;             ///< Stream configured; disabled streams are HEALTHY
    BoolProbe healthy;             ///< Connection alive
    LastEventProbe last_message;   ///< Time of last received message (optional)
};

/**
 * @brief API client check
 *
 * @param server_time Server time probe
 * @param breakers Registry whose breakers are inspected (may be null)
 * @return HealthCheckFn Check
 */
HealthCheckFn make_api_client_check(ServerTimeProbe server_time,
                                    std::shared_ptr<const CircuitBreakerRegistry> breakers);

/**
 * @brief Data stream check
 *
 * A stream that has not received any message yet is not considered stale.
 */
HealthCheckFn make_data_stream_check(DataStreamProbes probes,
                                     Seconds max_silence = Seconds(DEFAULT_MAX_STREAM_SILENCE_SECONDS));

HealthCheckFn make_strategy_check(LastEventProbe last_signal,
                                  Seconds max_signal_age = Seconds(DEFAULT_MAX_SIGNAL_AGE_SECONDS));

HealthCheckFn make_order_engine_check(BoolProbe can_place_orders);

HealthCheckFn make_persistence_check(BoolProbe ping);

} // namespace tradeguard
