/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for RateLimiter (keyed token buckets)
 */

#include <gtest/gtest.h>
#include "utils/rate_limiter.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace tradeguard;

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        RateLimitTable limits;
        limits["default"] = {10.0, 1.0};  // 10 tokens/second
        limits["order"] = {5.0, 1.0};     // 5 tokens/second
        limiter = std::make_unique<RateLimiter>(limits);
    }

    std::unique_ptr<RateLimiter> limiter;
};

// ============================================================================
// Configuration
// ============================================================================

TEST_F(RateLimiterTest, DefaultTable) {
    auto table = default_rate_limits();

    ASSERT_EQ(table.size(), 5u);
    EXPECT_DOUBLE_EQ(table.at("default").max_tokens, 100.0);
    EXPECT_DOUBLE_EQ(table.at("order").max_tokens, 50.0);
    EXPECT_DOUBLE_EQ(table.at("position").max_tokens, 50.0);
    EXPECT_DOUBLE_EQ(table.at("market").max_tokens, 120.0);
    EXPECT_DOUBLE_EQ(table.at("account").max_tokens, 60.0);

    for (const auto& [key, limit] : table) {
        EXPECT_DOUBLE_EQ(limit.interval_seconds, 10.0) << key;
    }
}

TEST_F(RateLimiterTest, DefaultConstructedLimiter) {
    RateLimiter defaults;

    auto limits = defaults.get_limits();
    ASSERT_EQ(limits.size(), 5u);

    // 120 calls per 10s = 12 tokens/second
    EXPECT_DOUBLE_EQ(limits.at("market").max_tokens, 120.0);
    EXPECT_DOUBLE_EQ(limits.at("market").refill_rate, 12.0);
}

TEST_F(RateLimiterTest, DefaultKeyAlwaysPresent) {
    RateLimitTable limits;
    limits["order"] = {5.0, 1.0};
    RateLimiter without_default(limits);

    EXPECT_TRUE(without_default.has_limit(DEFAULT_LIMIT_KEY));
    EXPECT_TRUE(without_default.has_limit("order"));
}

TEST_F(RateLimiterTest, InvalidLimits) {
    EXPECT_THROW(limiter->add_limit("bad", 0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(limiter->add_limit("bad", 10.0, 0.0), std::invalid_argument);
    EXPECT_THROW(limiter->add_limit("bad", 10.0, -1.0), std::invalid_argument);
    EXPECT_FALSE(limiter->has_limit("bad"));
}

TEST_F(RateLimiterTest, AddLimitReplacesBucket) {
    EXPECT_TRUE(limiter->limit("order", 5.0, false));
    EXPECT_FALSE(limiter->limit("order", 1.0, false));

    // Fresh bucket starts full
    limiter->add_limit("order", 20.0, 1.0);
    EXPECT_TRUE(limiter->limit("order", 20.0, false));

    auto limits = limiter->get_limits();
    EXPECT_DOUBLE_EQ(limits.at("order").max_tokens, 20.0);
    EXPECT_DOUBLE_EQ(limits.at("order").refill_rate, 20.0);
}

// ============================================================================
// Limiting
// ============================================================================

TEST_F(RateLimiterTest, KeysAreIndependent) {
    EXPECT_TRUE(limiter->limit("order", 5.0, false));
    EXPECT_FALSE(limiter->limit("order", 1.0, false));

    // Default bucket untouched
    EXPECT_TRUE(limiter->limit("default", 1.0, false));
}

TEST_F(RateLimiterTest, UnknownKeyUsesDefault) {
    EXPECT_TRUE(limiter->limit("unknown", 10.0, false));

    // Default is now empty
    EXPECT_FALSE(limiter->limit("default", 1.0, false));
    EXPECT_FALSE(limiter->has_limit("unknown"));
}

TEST_F(RateLimiterTest, BlockingWaits) {
    EXPECT_TRUE(limiter->limit("order", 5.0, false));

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter->limit("order", 1.0, true));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // 1 token at 5/sec = ~200ms
    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
}

TEST_F(RateLimiterTest, TimeoutRejects) {
    EXPECT_TRUE(limiter->limit("order", 5.0, false));
    EXPECT_FALSE(limiter->limit("order", 5.0, true, Seconds(0.05)));
}

TEST_F(RateLimiterTest, WaitingKeyDoesNotBlockOtherKeys) {
    EXPECT_TRUE(limiter->limit("order", 5.0, false));

    std::thread waiter([this]() {
        // ~1s wait on the order bucket
        limiter->limit("order", 5.0, true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(limiter->limit("default", 1.0, false));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(100));

    waiter.join();
}

// ============================================================================
// Statistics
// ============================================================================

TEST_F(RateLimiterTest, StatsCountRequestsPerKey) {
    limiter->limit("order", 1.0, false);
    limiter->limit("order", 1.0, false);
    limiter->limit("default", 1.0, false);
    limiter->limit("unknown", 1.0, false);

    auto stats = limiter->get_stats();
    EXPECT_EQ(stats.at("order"), 2u);
    EXPECT_EQ(stats.at("default"), 1u);
    EXPECT_EQ(stats.at("unknown"), 1u);
}

TEST_F(RateLimiterTest, StatsCountRejectedRequests) {
    limiter->limit("order", 5.0, false);
    EXPECT_FALSE(limiter->limit("order", 1.0, false));

    EXPECT_EQ(limiter->get_stats().at("order"), 2u);
}

TEST_F(RateLimiterTest, ResetStats) {
    limiter->limit("order", 1.0, false);
    limiter->reset_stats();

    EXPECT_TRUE(limiter->get_stats().empty());
}

TEST_F(RateLimiterTest, TokenCount) {
    EXPECT_NEAR(limiter->get_token_count("order"), 5.0, 0.01);

    limiter->limit("order", 2.0, false);
    EXPECT_NEAR(limiter->get_token_count("order"), 3.0, 0.1);

    EXPECT_DOUBLE_EQ(limiter->get_token_count("unknown"), 0.0);
}

TEST_F(RateLimiterTest, GetLimitsSnapshot) {
    limiter->limit("order", 4.0, false);

    auto limits = limiter->get_limits();
    ASSERT_EQ(limits.size(), 2u);

    const auto& order = limits.at("order");
    EXPECT_DOUBLE_EQ(order.max_tokens, 5.0);
    EXPECT_DOUBLE_EQ(order.refill_rate, 5.0);
    EXPECT_NEAR(order.current_tokens, 1.0, 0.1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(RateLimiterTest, ConcurrentAccess) {
    RateLimitTable limits;
    limits["default"] = {100.0, 100000.0};  // Negligible refill
    RateLimiter shared(limits);

    std::atomic<int> granted{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                if (shared.limit("default", 1.0, false)) {
                    granted++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(granted.load(), 100);
    EXPECT_EQ(shared.get_stats().at("default"), 200u);
}
