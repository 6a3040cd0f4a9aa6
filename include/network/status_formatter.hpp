/**
 * @file status_formatter.hpp
 * @brief JSON status documents for monitoring endpoints
 *
 * Renders rate limiter, circuit breaker, failover and API call state as
 * compact JSON strings, ready to be served by a REST status route or
 * pushed to a dashboard.
 *
 * **Document Types:**
 * - rate_limits: bucket capacity, refill rate and level per key
 * - rate_limit_stats: limit() invocations per key
 * - circuit_breakers: state per operation
 * - failover_status: global state, components, configuration
 * - api_metrics: guarded call counters and latency percentiles
 * - metric: one MetricPoint (also the JSON lines format of MetricsRecorder)
 *
 * Non-finite numbers (NaN, infinity) are written as null.
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "core/types.hpp"
#include "failover/failover_manager.hpp"
#include "metrics/api_call_metrics.hpp"
#include "metrics/metrics_sink.hpp"
#include "resilience/circuit_breaker.hpp"
#include "utils/rate_limiter.hpp"
#include "utils/time_utils.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace tradeguard {

/**
 * @brief Status JSON formatter
 *
 * Stateless; every method is static.
 *
 * @code
 * std::string body = StatusFormatter::format_failover_status(
 *     failover.get_failover_status());
 * // {"type":"failover_status","state":"DEGRADED","components":{...},...}
 * @endcode
 */
class StatusFormatter {
public:
    /**
     * @brief Escape a string for inclusion in a JSON string literal
     */
    static std::string escape_json(const std::string& value) {
        std::string out;
        out.reserve(value.size() + 2);

        for (char c : value) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }

        return out;
    }

    static std::string format_rate_limits(const std::map<std::string, RateLimitInfo>& limits) {
        std::ostringstream json;

        json << "{\"type\":\"rate_limits\",\"limits\":{";

        bool first = true;
        for (const auto& [key, info] : limits) {
            if (!first) json << ",";
            first = false;

            json << "\"" << escape_json(key) << "\":{"
                 << "\"max_tokens\":" << number_to_json(info.max_tokens, 4) << ","
                 << "\"refill_rate\":" << number_to_json(info.refill_rate, 4) << ","
                 << "\"current_tokens\":" << number_to_json(info.current_tokens, 4)
                 << "}";
        }

        json << "}}";
        return json.str();
    }

    static std::string format_rate_limit_stats(const std::map<std::string, uint64_t>& stats) {
        std::ostringstream json;

        uint64_t total = 0;
        json << "{\"type\":\"rate_limit_stats\",\"calls\":{";

        bool first = true;
        for (const auto& [key, count] : stats) {
            if (!first) json << ",";
            first = false;

            json << "\"" << escape_json(key) << "\":" << count;
            total += count;
        }

        json << "},\"total\":" << total << "}";
        return json.str();
    }

    static std::string format_circuit_states(const std::map<std::string, CircuitState>& states) {
        std::ostringstream json;

        size_t open = 0;
        json << "{\"type\":\"circuit_breakers\",\"circuits\":{";

        bool first = true;
        for (const auto& [name, state] : states) {
            if (!first) json << ",";
            first = false;

            json << "\"" << escape_json(name) << "\":\""
                 << circuit_state_to_string(state) << "\"";
            if (state == CircuitState::OPEN) {
                open++;
            }
        }

        json << "},\"open\":" << open << "}";
        return json.str();
    }

    /**
     * @brief Failover manager snapshot
     *
     * Timestamps are ISO 8601 UTC strings, or null if never set.
     */
    static std::string format_failover_status(const FailoverStatus& status) {
        std::ostringstream json;

        json << "{"
             << "\"type\":\"failover_status\","
             << "\"state\":\"" << failover_state_to_string(status.state) << "\","
             << "\"running\":" << bool_to_json(status.running) << ","
             << "\"shutdown_triggered\":" << bool_to_json(status.shutdown_triggered) << ","
             << "\"components\":{";

        bool first = true;
        for (const auto& [name, component] : status.components) {
            if (!first) json << ",";
            first = false;

            json << "\"" << escape_json(name) << "\":{"
                 << "\"status\":\"" << component_status_to_string(component.status) << "\","
                 << "\"critical\":" << bool_to_json(component.critical) << ","
                 << "\"failure_count\":" << component.failure_count << ","
                 << "\"recovery_attempts\":" << component.recovery_attempts << ","
                 << "\"last_check\":" << optional_time_to_json(component.last_check) << ","
                 << "\"last_failure\":" << optional_time_to_json(component.last_failure)
                 << "}";
        }

        const auto& config = status.config;
        json << "},"
             << "\"config\":{"
             << "\"enabled\":" << bool_to_json(config.enabled) << ","
             << "\"auto_recovery\":" << bool_to_json(config.auto_recovery) << ","
             << "\"max_recovery_attempts\":" << config.max_recovery_attempts << ","
             << "\"recovery_backoff\":" << number_to_json(config.recovery_backoff.count(), 1) << ","
             << "\"emergency_shutdown\":" << bool_to_json(config.emergency_shutdown) << ","
             << "\"notification_enabled\":" << bool_to_json(config.notification_enabled) << ","
             << "\"check_interval\":" << number_to_json(config.check_interval.count(), 1)
             << "}"
             << "}";

        return json.str();
    }

    static std::string format_api_metrics(const ApiCallSummary& summary) {
        std::ostringstream json;

        json << "{"
             << "\"type\":\"api_metrics\","
             << "\"calls\":{"
             << "\"total\":" << summary.total_calls << ","
             << "\"successful\":" << summary.successful_calls << ","
             << "\"failed\":" << summary.failed_calls << ","
             << "\"rate_limited\":" << summary.rate_limited << ","
             << "\"circuit_rejected\":" << summary.circuit_rejected << ","
             << "\"retries\":" << summary.retries
             << "},"
             << "\"latency_us\":{"
             << "\"avg\":" << number_to_json(summary.latency_avg_us, 1) << ","
             << "\"max\":" << summary.latency_max_us << ","
             << "\"p50\":" << summary.latency_p50_us << ","
             << "\"p95\":" << summary.latency_p95_us << ","
             << "\"p99\":" << summary.latency_p99_us
             << "}"
             << "}";

        return json.str();
    }

    /**
     * @brief One metric point
     *
     * @code
     * {"category":"api","name":"open_circuits","value":1.000000,
     *  "timestamp":"2024-11-24T10:30:45.123456789Z","tags":{}}
     * @endcode
     */
    static std::string format_metric_point(const MetricPoint& point) {
        std::ostringstream json;

        json << "{"
             << "\"category\":\"" << escape_json(point.category) << "\","
             << "\"name\":\"" << escape_json(point.name) << "\","
             << "\"value\":" << number_to_json(point.value, 6) << ","
             << "\"timestamp\":\"" << nanos_to_iso8601(point.timestamp_ns) << "\","
             << "\"tags\":{";

        bool first = true;
        for (const auto& [key, value] : point.tags) {
            if (!first) json << ",";
            first = false;
            json << "\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }

        json << "}}";
        return json.str();
    }

private:
    static std::string number_to_json(double value, int precision) {
        if (!std::isfinite(value)) {
            return "null";
        }

        std::ostringstream out;
        out << std::fixed << std::setprecision(precision) << value;
        return out.str();
    }

    static const char* bool_to_json(bool value) {
        return value ? "true" : "false";
    }

    static std::string optional_time_to_json(const std::optional<SystemClock::time_point>& time) {
        if (!time) {
            return "null";
        }
        return "\"" + time_point_to_iso8601(*time) + "\"";
    }
};

} // namespace tradeguard
