/**
 * @file test_status_formatter.cpp
 * @brief Unit tests for StatusFormatter JSON output
 */

#include <gtest/gtest.h>
#include "network/status_formatter.hpp"
#include <chrono>
#include <limits>
#include <string>

using namespace tradeguard;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Escaping
// ============================================================================

TEST(StatusFormatterTest, EscapeJson) {
    EXPECT_EQ(StatusFormatter::escape_json("plain"), "plain");
    EXPECT_EQ(StatusFormatter::escape_json("a\"b"), "a\\\"b");
    EXPECT_EQ(StatusFormatter::escape_json("a\\b"), "a\\\\b");
    EXPECT_EQ(StatusFormatter::escape_json("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(StatusFormatter::escape_json(std::string("\x01", 1)), "\\u0001");
}

// ============================================================================
// Rate Limits / Circuits
// ============================================================================

TEST(StatusFormatterTest, RateLimits) {
    std::map<std::string, RateLimitInfo> limits;
    limits["order"] = RateLimitInfo{50.0, 5.0, 12.5};

    auto json = StatusFormatter::format_rate_limits(limits);

    EXPECT_EQ(json, "{\"type\":\"rate_limits\",\"limits\":{\"order\":{"
                    "\"max_tokens\":50.0000,\"refill_rate\":5.0000,\"current_tokens\":12.5000}}}");
}

TEST(StatusFormatterTest, RateLimitStats) {
    std::map<std::string, uint64_t> stats{{"market", 7}, {"order", 3}};

    auto json = StatusFormatter::format_rate_limit_stats(stats);

    EXPECT_EQ(json, "{\"type\":\"rate_limit_stats\",\"calls\":{\"market\":7,\"order\":3},\"total\":10}");
}

TEST(StatusFormatterTest, EmptyStats) {
    EXPECT_EQ(StatusFormatter::format_rate_limit_stats({}),
              "{\"type\":\"rate_limit_stats\",\"calls\":{},\"total\":0}");
}

TEST(StatusFormatterTest, CircuitStates) {
    std::map<std::string, CircuitState> states{
        {"get_ticker", CircuitState::CLOSED},
        {"place_order", CircuitState::OPEN},
        {"set_leverage", CircuitState::HALF_OPEN}
    };

    auto json = StatusFormatter::format_circuit_states(states);

    EXPECT_EQ(json, "{\"type\":\"circuit_breakers\",\"circuits\":{"
                    "\"get_ticker\":\"CLOSED\",\"place_order\":\"OPEN\",\"set_leverage\":\"HALF_OPEN\"},"
                    "\"open\":1}");
}

// ============================================================================
// Failover
// ============================================================================

TEST(StatusFormatterTest, FailoverStatus) {
    FailoverStatus status;
    status.state = FailoverState::EMERGENCY;
    status.running = true;
    status.shutdown_triggered = true;

    ComponentSnapshot api;
    api.name = component::API_CLIENT;
    api.status = ComponentStatus::FAILED;
    api.critical = true;
    api.failure_count = 4;
    api.recovery_attempts = 3;
    api.last_check = SystemClock::time_point{std::chrono::seconds(1732444245)};
    status.components.emplace(api.name, api);

    auto json = StatusFormatter::format_failover_status(status);

    EXPECT_TRUE(contains(json, "\"type\":\"failover_status\""));
    EXPECT_TRUE(contains(json, "\"state\":\"EMERGENCY\""));
    EXPECT_TRUE(contains(json, "\"running\":true"));
    EXPECT_TRUE(contains(json, "\"shutdown_triggered\":true"));
    EXPECT_TRUE(contains(json, "\"api_client\":{\"status\":\"FAILED\",\"critical\":true,"
                               "\"failure_count\":4,\"recovery_attempts\":3,"
                               "\"last_check\":\"2024-11-24T10:30:45.000000000Z\","
                               "\"last_failure\":null}"));
    EXPECT_TRUE(contains(json, "\"max_recovery_attempts\":3"));
    EXPECT_TRUE(contains(json, "\"recovery_backoff\":60.0"));
    EXPECT_TRUE(contains(json, "\"check_interval\":30.0"));
}

// ============================================================================
// Metrics
// ============================================================================

TEST(StatusFormatterTest, ApiMetrics) {
    ApiCallSummary summary{};
    summary.total_calls = 10;
    summary.successful_calls = 7;
    summary.failed_calls = 1;
    summary.rate_limited = 1;
    summary.circuit_rejected = 1;
    summary.retries = 2;
    summary.latency_avg_us = 1250.0;
    summary.latency_max_us = 4000;

    auto json = StatusFormatter::format_api_metrics(summary);

    EXPECT_TRUE(contains(json, "\"calls\":{\"total\":10,\"successful\":7,\"failed\":1,"
                               "\"rate_limited\":1,\"circuit_rejected\":1,\"retries\":2}"));
    EXPECT_TRUE(contains(json, "\"avg\":1250.0,\"max\":4000"));
}

TEST(StatusFormatterTest, MetricPoint) {
    MetricPoint point;
    point.category = "failover";
    point.name = "state";
    point.value = 4.0;
    point.timestamp_ns = 0;
    point.tags = {{"state", "EMERGENCY"}};

    EXPECT_EQ(StatusFormatter::format_metric_point(point),
              "{\"category\":\"failover\",\"name\":\"state\",\"value\":4.000000,"
              "\"timestamp\":\"1970-01-01T00:00:00.000000000Z\",\"tags\":{\"state\":\"EMERGENCY\"}}");
}

TEST(StatusFormatterTest, NonFiniteNumbersAreNull) {
    ApiCallSummary summary{};
    summary.latency_avg_us = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(contains(StatusFormatter::format_api_metrics(summary), "\"avg\":null,\"max\":0"));

    MetricPoint point;
    point.category = "api";
    point.name = "error_rate";
    point.value = std::numeric_limits<double>::infinity();
    point.timestamp_ns = 0;
    EXPECT_EQ(StatusFormatter::format_metric_point(point),
              "{\"category\":\"api\",\"name\":\"error_rate\",\"value\":null,"
              "\"timestamp\":\"1970-01-01T00:00:00.000000000Z\",\"tags\":{}}");

    std::map<std::string, RateLimitInfo> limits;
    limits["default"] = RateLimitInfo{100.0, 10.0, -std::numeric_limits<double>::infinity()};
    EXPECT_TRUE(contains(StatusFormatter::format_rate_limits(limits), "\"current_tokens\":null"));
}

