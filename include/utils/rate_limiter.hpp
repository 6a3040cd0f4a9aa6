/**
 * @file rate_limiter.hpp
 * @brief Named registry of token buckets, one per API call class
 *
 * Exchange APIs budget requests per endpoint family ("order", "market",
 * "account", ...). The RateLimiter keeps one TokenBucket per family and
 * counts every limit() invocation per key for observability.
 *
 * **Default Limits** (max_tokens per interval):
 * - default:  100 per 10s
 * - order:    50 per 10s
 * - position: 50 per 10s
 * - market:   120 per 10s
 * - account:  60 per 10s
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "utils/token_bucket.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tradeguard {

/**
 * @brief Budget for one call class
 */
struct RateLimit {
    double max_tokens{100.0};       ///< Calls allowed per interval (burst size)
    double interval_seconds{10.0};  ///< Interval length in seconds
};

/// Limit key -> budget
using RateLimitTable = std::map<std::string, RateLimit>;

/**
 * @brief Observability snapshot of one bucket
 */
struct RateLimitInfo {
    double max_tokens{0.0};       ///< Capacity
    double refill_rate{0.0};      ///< Tokens per second
    double current_tokens{0.0};   ///< Level at snapshot time
};

/// Key of the fallback bucket used for unknown keys
inline constexpr const char* DEFAULT_LIMIT_KEY = "default";

/**
 * @brief Built-in limit table
 *
 * @return RateLimitTable Default budgets listed in the file header
 */
RateLimitTable default_rate_limits();

/**
 * @brief Per-call-class rate limiter
 *
 * Unknown keys fall back to the "default" bucket with a warning; the
 * call is never failed because the key is missing. A "default" bucket
 * always exists: the constructor adds one if the table lacks it.
 *
 * @code
 * RateLimiter limiter;                     // default table
 * limiter.add_limit("kline", 30, 5.0);     // 30 calls per 5s
 *
 * if (!limiter.limit("order", 1.0, false)) {
 *     // soft failure: order budget exhausted
 * }
 *
 * limiter.limit("market");                 // blocks until a token is free
 * auto usage = limiter.get_stats();        // {"market": 1, "order": 1}
 * @endcode
 *
 * @note Thread-safe
 * @note Keys are added but never removed
 */
class RateLimiter {
public:
    /**
     * @brief Construct from a limit table
     *
     * @param limits Key -> budget table
     *
     * @throws std::invalid_argument if any budget is not positive
     */
    explicit RateLimiter(const RateLimitTable& limits = default_rate_limits());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * @brief Acquire tokens for a call class
     *
     * Increments the usage counter for @p key whether or not the
     * tokens are granted.
     *
     * @param key Call class; unknown keys use "default"
     * @param tokens Tokens to consume
     * @param block Wait for refill if short
     * @param timeout Maximum acceptable wait
     * @return bool True if granted, false if rejected
     *
     * @see TokenBucket::consume()
     */
    bool limit(const std::string& key = DEFAULT_LIMIT_KEY, double tokens = 1.0,
               bool block = true, std::optional<Seconds> timeout = std::nullopt);

    /**
     * @brief Create or replace the bucket for a key
     *
     * The new bucket starts full, with refill_rate = max_tokens / interval.
     * Threads already waiting on a replaced bucket finish against it.
     *
     * @param key Call class
     * @param max_tokens Calls per interval (must be > 0)
     * @param interval_seconds Interval length (must be > 0)
     *
     * @throws std::invalid_argument on non-positive values
     */
    void add_limit(const std::string& key, double max_tokens, double interval_seconds);

    /**
     * @brief Check whether a key has its own bucket
     */
    bool has_limit(const std::string& key) const;

    /**
     * @brief Snapshot of all buckets
     *
     * @return std::map<std::string, RateLimitInfo> Key -> capacity, rate, level
     */
    std::map<std::string, RateLimitInfo> get_limits() const;

    /**
     * @brief Per-key invocation counts
     *
     * @return std::map<std::string, uint64_t> Key -> number of limit() calls
     */
    std::map<std::string, uint64_t> get_stats() const;

    /**
     * @brief Clear invocation counts
     */
    void reset_stats();

    /**
     * @brief Current level of a key's bucket
     *
     * @param key Call class
     * @return double Token level, 0 for unknown keys
     */
    double get_token_count(const std::string& key = DEFAULT_LIMIT_KEY) const;

private:
    mutable std::mutex buckets_mutex_;                              ///< Protects buckets_
    std::map<std::string, std::shared_ptr<TokenBucket>> buckets_;   ///< Key -> bucket

    mutable std::mutex stats_mutex_;                                ///< Protects stats_
    std::map<std::string, uint64_t> stats_;                         ///< Key -> call count

    /**
     * @brief Look up the bucket for a key, falling back to "default"
     */
    std::shared_ptr<TokenBucket> find_bucket(const std::string& key) const;
};

} // namespace tradeguard
