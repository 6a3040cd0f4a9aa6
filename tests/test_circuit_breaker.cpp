/**
 * @file test_circuit_breaker.cpp
 * @brief Unit tests for CircuitBreaker and CircuitBreakerRegistry
 */

#include <gtest/gtest.h>
#include "resilience/circuit_breaker.hpp"
#include "resilience/circuit_breaker_registry.hpp"
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tradeguard;

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.error_threshold = 3;
        config.error_timeout = Seconds(60.0);
        config.circuit_timeout = Seconds(0.05);
        breaker = std::make_unique<CircuitBreaker>("place_order", config);
    }

    void trip() {
        for (uint32_t i = 0; i < config.error_threshold; ++i) {
            breaker->record_error();
        }
    }

    void wait_circuit_timeout() {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
    }

    CircuitBreakerConfig config;
    std::unique_ptr<CircuitBreaker> breaker;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(CircuitBreakerTest, InitialState) {
    EXPECT_EQ(breaker->get_state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker->get_error_count(), 0u);
    EXPECT_EQ(breaker->name(), "place_order");
    EXPECT_TRUE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, DefaultConfig) {
    CircuitBreakerConfig defaults;
    EXPECT_EQ(defaults.error_threshold, 5u);
    EXPECT_DOUBLE_EQ(defaults.error_timeout.count(), 60.0);
    EXPECT_DOUBLE_EQ(defaults.circuit_timeout.count(), 300.0);
    EXPECT_TRUE(defaults.single_probe);
}

TEST_F(CircuitBreakerTest, InvalidConfig) {
    CircuitBreakerConfig bad;
    bad.error_threshold = 0;
    EXPECT_THROW(CircuitBreaker("x", bad), std::invalid_argument);

    bad = CircuitBreakerConfig{};
    bad.circuit_timeout = Seconds(-1.0);
    EXPECT_THROW(validate_circuit_breaker_config(bad), std::invalid_argument);
}

// ============================================================================
// Closed -> Open
// ============================================================================

TEST_F(CircuitBreakerTest, OpensAtThreshold) {
    breaker->record_error();
    breaker->record_error();
    EXPECT_EQ(breaker->get_state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker->get_error_count(), 2u);

    breaker->record_error();
    EXPECT_EQ(breaker->get_state(), CircuitState::OPEN);
    EXPECT_FALSE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, SuccessDoesNotResetClosedCount) {
    breaker->record_error();
    breaker->record_error();
    breaker->record_success();

    EXPECT_EQ(breaker->get_error_count(), 2u);

    breaker->record_error();
    EXPECT_EQ(breaker->get_state(), CircuitState::OPEN);
}

TEST_F(CircuitBreakerTest, ErrorTimeoutResetsCount) {
    CircuitBreakerConfig fast = config;
    fast.error_timeout = Seconds(0.05);
    CircuitBreaker windowed("get_ticker", fast);

    windowed.record_error();
    windowed.record_error();

    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    // Stale errors forgotten, this one starts a new window
    windowed.record_error();
    EXPECT_EQ(windowed.get_error_count(), 1u);
    EXPECT_EQ(windowed.get_state(), CircuitState::CLOSED);
}

TEST_F(CircuitBreakerTest, ErrorsWhileOpenIgnored) {
    trip();
    ASSERT_EQ(breaker->get_state(), CircuitState::OPEN);

    breaker->record_error();
    EXPECT_EQ(breaker->get_state(), CircuitState::OPEN);
    EXPECT_EQ(breaker->get_error_count(), 0u);
}

// ============================================================================
// Open -> Half-Open -> Closed/Open
// ============================================================================

TEST_F(CircuitBreakerTest, HalfOpenAfterTimeout) {
    trip();
    EXPECT_FALSE(breaker->allow_request());

    wait_circuit_timeout();

    EXPECT_TRUE(breaker->allow_request());
    EXPECT_EQ(breaker->get_state(), CircuitState::HALF_OPEN);
}

TEST_F(CircuitBreakerTest, HalfOpenSuccessCloses) {
    trip();
    wait_circuit_timeout();
    ASSERT_TRUE(breaker->allow_request());

    breaker->record_success();

    EXPECT_EQ(breaker->get_state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker->get_error_count(), 0u);
    EXPECT_TRUE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, HalfOpenErrorReopens) {
    trip();
    wait_circuit_timeout();
    ASSERT_TRUE(breaker->allow_request());

    breaker->record_error();

    EXPECT_EQ(breaker->get_state(), CircuitState::OPEN);
    EXPECT_FALSE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, SingleProbeInHalfOpen) {
    trip();
    wait_circuit_timeout();

    EXPECT_TRUE(breaker->allow_request());
    EXPECT_FALSE(breaker->allow_request());
    EXPECT_FALSE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, AbandonedProbeReplaced) {
    trip();
    wait_circuit_timeout();
    ASSERT_TRUE(breaker->allow_request());
    ASSERT_FALSE(breaker->allow_request());

    // Probe never reported back
    wait_circuit_timeout();

    EXPECT_TRUE(breaker->allow_request());
    EXPECT_EQ(breaker->get_state(), CircuitState::HALF_OPEN);
}

TEST_F(CircuitBreakerTest, MultipleProbesWhenDisabled) {
    CircuitBreakerConfig permissive = config;
    permissive.single_probe = false;
    CircuitBreaker open_probe("get_klines", permissive);

    for (uint32_t i = 0; i < permissive.error_threshold; ++i) {
        open_probe.record_error();
    }
    wait_circuit_timeout();

    EXPECT_TRUE(open_probe.allow_request());
    EXPECT_TRUE(open_probe.allow_request());
}

// ============================================================================
// Reset / Snapshot
// ============================================================================

TEST_F(CircuitBreakerTest, ResetFromOpen) {
    trip();
    breaker->reset();

    EXPECT_EQ(breaker->get_state(), CircuitState::CLOSED);
    EXPECT_EQ(breaker->get_error_count(), 0u);
    EXPECT_TRUE(breaker->allow_request());
}

TEST_F(CircuitBreakerTest, Snapshot) {
    breaker->record_error();

    auto closed = breaker->get_snapshot();
    EXPECT_EQ(closed.name, "place_order");
    EXPECT_EQ(closed.state, CircuitState::CLOSED);
    EXPECT_EQ(closed.error_count, 1u);
    EXPECT_DOUBLE_EQ(closed.seconds_since_open, 0.0);

    trip();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto open = breaker->get_snapshot();
    EXPECT_EQ(open.state, CircuitState::OPEN);
    EXPECT_GT(open.seconds_since_open, 0.0);
}

TEST_F(CircuitBreakerTest, StateNames) {
    EXPECT_STREQ(circuit_state_to_string(CircuitState::CLOSED), "CLOSED");
    EXPECT_STREQ(circuit_state_to_string(CircuitState::OPEN), "OPEN");
    EXPECT_STREQ(circuit_state_to_string(CircuitState::HALF_OPEN), "HALF_OPEN");
}

// ============================================================================
// Registry
// ============================================================================

class CircuitBreakerRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        CircuitBreakerConfig defaults;
        defaults.error_threshold = 2;
        defaults.circuit_timeout = Seconds(60.0);
        registry = std::make_unique<CircuitBreakerRegistry>(defaults);
    }

    std::unique_ptr<CircuitBreakerRegistry> registry;
};

TEST_F(CircuitBreakerRegistryTest, CreatesOnFirstUse) {
    EXPECT_EQ(registry->size(), 0u);

    auto breaker = registry->get_circuit_breaker("place_order");
    ASSERT_NE(breaker, nullptr);
    EXPECT_EQ(breaker->name(), "place_order");
    EXPECT_EQ(breaker->config().error_threshold, 2u);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(CircuitBreakerRegistryTest, SameInstanceReturned) {
    auto first = registry->get_circuit_breaker("place_order");
    auto second = registry->get_circuit_breaker("place_order");

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(CircuitBreakerRegistryTest, OverridesApplyOnCreationOnly) {
    CircuitBreakerConfig strict;
    strict.error_threshold = 1;

    auto created = registry->get_circuit_breaker("cancel_order", strict);
    EXPECT_EQ(created->config().error_threshold, 1u);

    CircuitBreakerConfig lenient;
    lenient.error_threshold = 10;

    auto existing = registry->get_circuit_breaker("cancel_order", lenient);
    EXPECT_EQ(existing->config().error_threshold, 1u);
}

TEST_F(CircuitBreakerRegistryTest, InvalidDefaults) {
    CircuitBreakerConfig bad;
    bad.error_threshold = 0;
    EXPECT_THROW(CircuitBreakerRegistry{bad}, std::invalid_argument);
}

TEST_F(CircuitBreakerRegistryTest, AllStatesAndCount) {
    auto orders = registry->get_circuit_breaker("place_order");
    registry->get_circuit_breaker("get_ticker");

    orders->record_error();
    orders->record_error();

    auto states = registry->get_all_states();
    ASSERT_EQ(states.size(), 2u);
    EXPECT_EQ(states.at("place_order"), CircuitState::OPEN);
    EXPECT_EQ(states.at("get_ticker"), CircuitState::CLOSED);

    EXPECT_EQ(registry->count_in_state(CircuitState::OPEN), 1u);
    EXPECT_EQ(registry->count_in_state(CircuitState::CLOSED), 1u);
    EXPECT_EQ(registry->count_in_state(CircuitState::HALF_OPEN), 0u);
}

TEST_F(CircuitBreakerRegistryTest, ResetAll) {
    auto a = registry->get_circuit_breaker("a");
    auto b = registry->get_circuit_breaker("b");
    a->record_error();
    a->record_error();
    b->record_error();
    b->record_error();

    registry->reset_all();

    EXPECT_EQ(registry->count_in_state(CircuitState::CLOSED), 2u);
    EXPECT_EQ(registry->size(), 2u);
}

TEST_F(CircuitBreakerRegistryTest, ConcurrentCreation) {
    std::vector<std::thread> threads;
    std::vector<CircuitBreaker*> seen(8, nullptr);

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &seen, t]() {
            seen[t] = registry->get_circuit_breaker("get_positions").get();
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    std::set<CircuitBreaker*> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), 1u);
    EXPECT_EQ(registry->size(), 1u);
}
