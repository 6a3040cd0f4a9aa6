/**
 * @file token_bucket.hpp
 * @brief Token bucket for a single class of API calls
 *
 * Implements the token bucket algorithm guarding one logical call class
 * (orders, market data, account queries, ...). Provides blocking,
 * non-blocking and bounded-wait consumption.
 *
 * **Token Bucket Algorithm:**
 * - Tokens refill continuously at a constant rate (tokens/second)
 * - Refill is lazy: computed on every access, no background timer
 * - Level never exceeds capacity and never drops below zero
 * - Each call consumes one or more tokens
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "core/types.hpp"
#include <mutex>
#include <optional>

namespace tradeguard {

/**
 * @brief Mutex-guarded token bucket
 *
 * A consume() call is serialized from the first refill through any wait
 * to the final subtraction. The bucket lock is held while sleeping, so a
 * slow consumer delays other consumers of the same bucket; this keeps the
 * accounting exact. Buckets of different call classes never contend.
 *
 * @code
 * // 50 calls per 10 seconds, burst of 50
 * TokenBucket bucket(50.0, 5.0);
 *
 * // Blocking consume (waits for refill)
 * bucket.consume();
 *
 * // Non-blocking consume
 * if (!bucket.consume(1.0, false)) {
 *     // rate limited, caller decides what to do
 * }
 *
 * // Wait at most 200ms
 * bucket.consume(5.0, true, Seconds(0.2));
 * @endcode
 *
 * @note Thread-safe
 * @note No fairness between waiting consumers
 */
class TokenBucket {
public:
    /**
     * @brief Construct token bucket
     *
     * @param max_tokens Capacity (must be > 0)
     * @param refill_rate Refill rate in tokens per second (must be > 0)
     * @param initial_tokens Starting level, defaults to full capacity
     *
     * @throws std::invalid_argument if capacity or rate is not positive,
     *         or the initial level is outside [0, max_tokens]
     */
    TokenBucket(double max_tokens, double refill_rate,
                std::optional<double> initial_tokens = std::nullopt);

    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    /**
     * @brief Consume tokens
     *
     * Refills, then:
     * - enough tokens: subtract and return true immediately
     * - not enough and @p block is false: return false
     * - blocking: compute wait = deficit / refill_rate; if a timeout is
     *   given and wait exceeds it return false without waiting or
     *   consuming, otherwise sleep, refill, subtract and return true
     *
     * @param tokens Number of tokens requested (must be > 0)
     * @param block Wait for refill if tokens are short
     * @param timeout Maximum acceptable wait (blocking mode only)
     * @return bool True if the tokens were granted
     *
     * @throws std::invalid_argument if @p tokens is not positive
     *
     * @note Requests larger than capacity can never be satisfied and
     *       return false immediately
     */
    bool consume(double tokens = 1.0, bool block = true,
                 std::optional<Seconds> timeout = std::nullopt);

    /**
     * @brief Get current token level
     *
     * Refills before reading, so the value reflects elapsed time.
     *
     * @return double Current tokens
     */
    double get_token_count() const;

    double max_tokens() const { return max_tokens_; }
    double refill_rate() const { return refill_rate_; }

private:
    const double max_tokens_;                           ///< Capacity
    const double refill_rate_;                          ///< Tokens per second

    mutable std::mutex mutex_;                          ///< Serializes consume()
    mutable double tokens_;                             ///< Current level
    mutable SteadyClock::time_point last_refill_time_;  ///< Last refill instant

    /**
     * @brief Add tokens for time elapsed since last refill
     *
     * @note Caller must hold mutex_
     */
    void refill() const;
};

} // namespace tradeguard
