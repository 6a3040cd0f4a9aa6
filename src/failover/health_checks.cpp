/**
 * @file health_checks.cpp
 * @brief Health check factory implementations
 */

#include "failover/health_checks.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace tradeguard {

namespace {

/**
 * @brief Run a check body, turning exceptions into FAILED
 */
template<typename Body>
ComponentStatus guarded(const char* component_name, Body&& body) {
    try {
        return body();
    } catch (const std::exception& e) {
        spdlog::error("HealthCheck: Error checking {}: {}", component_name, e.what());
        return ComponentStatus::FAILED;
    } catch (...) {
        spdlog::error("HealthCheck: Error checking {}: unknown exception", component_name);
        return ComponentStatus::FAILED;
    }
}

bool is_stale(const std::optional<SystemClock::time_point>& last, Seconds max_age) {
    if (!last) {
        return false;
    }
    return Seconds(SystemClock::now() - *last) > max_age;
}

} // namespace

HealthCheckFn make_api_client_check(ServerTimeProbe server_time,
                                    std::shared_ptr<const CircuitBreakerRegistry> breakers) {
    return [server_time = std::move(server_time), breakers = std::move(breakers)]() {
        if (!server_time) {
            return ComponentStatus::FAILED;
        }

        return guarded(component::API_CLIENT, [&]() {
            if (!server_time()) {
                return ComponentStatus::CRITICAL;
            }

            if (breakers && breakers->count_in_state(CircuitState::OPEN) > 0) {
                return ComponentStatus::WARNING;
            }

            return ComponentStatus::HEALTHY;
        });
    };
}

HealthCheckFn make_data_stream_check(DataStreamProbes probes, Seconds max_silence) {
    return [probes = std::move(probes), max_silence]() {
        return guarded(component::DATA_STREAM, [&]() {
            if (probes.enabled && !probes.enabled()) {
                return ComponentStatus::HEALTHY;
            }

            if (!probes.healthy) {
                return ComponentStatus::WARNING;
            }

            if (!probes.healthy()) {
                return ComponentStatus::CRITICAL;
            }

            if (probes.last_message && is_stale(probes.last_message(), max_silence)) {
                return ComponentStatus::WARNING;
            }

            return ComponentStatus::HEALTHY;
        });
    };
}

HealthCheckFn make_strategy_check(LastEventProbe last_signal, Seconds max_signal_age) {
    return [last_signal = std::move(last_signal), max_signal_age]() {
        if (!last_signal) {
            return ComponentStatus::FAILED;
        }

        return guarded(component::STRATEGY_ENGINE, [&]() {
            if (is_stale(last_signal(), max_signal_age)) {
                return ComponentStatus::WARNING;
            }
            return ComponentStatus::HEALTHY;
        });
    };
}

HealthCheckFn make_order_engine_check(BoolProbe can_place_orders) {
    return [can_place_orders = std::move(can_place_orders)]() {
        if (!can_place_orders) {
            return ComponentStatus::FAILED;
        }

        return guarded(component::ORDER_ENGINE, [&]() {
            return can_place_orders() ? ComponentStatus::HEALTHY : ComponentStatus::CRITICAL;
        });
    };
}

HealthCheckFn make_persistence_check(BoolProbe ping) {
    return [ping = std::move(ping)]() {
        if (!ping) {
            return ComponentStatus::FAILED;
        }

        return guarded(component::PERSISTENCE, [&]() {
            return ping() ? ComponentStatus::HEALTHY : ComponentStatus::WARNING;
        });
    };
}

} // namespace tradeguard
