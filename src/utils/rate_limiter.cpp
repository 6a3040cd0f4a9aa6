/**
 * @file rate_limiter.cpp
 * @brief Rate limiter implementation
 */

#include "utils/rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tradeguard {

RateLimitTable default_rate_limits() {
    return {
        {"default", {100.0, 10.0}},
        {"order", {50.0, 10.0}},
        {"position", {50.0, 10.0}},
        {"market", {120.0, 10.0}},
        {"account", {60.0, 10.0}},
    };
}

RateLimiter::RateLimiter(const RateLimitTable& limits) {
    for (const auto& [key, limit] : limits) {
        add_limit(key, limit.max_tokens, limit.interval_seconds);
    }

    if (!has_limit(DEFAULT_LIMIT_KEY)) {
        const auto fallback = default_rate_limits().at(DEFAULT_LIMIT_KEY);
        add_limit(DEFAULT_LIMIT_KEY, fallback.max_tokens, fallback.interval_seconds);
    }

    spdlog::info("RateLimiter: Initialized with {} limits", buckets_.size());
}

void RateLimiter::add_limit(const std::string& key, double max_tokens, double interval_seconds) {
    if (!(interval_seconds > 0.0)) {
        throw std::invalid_argument("RateLimiter: interval for '" + key + "' must be > 0");
    }

    // TokenBucket validates max_tokens
    auto bucket = std::make_shared<TokenBucket>(max_tokens, max_tokens / interval_seconds);

    std::lock_guard<std::mutex> lock(buckets_mutex_);
    buckets_[key] = std::move(bucket);

    spdlog::debug("RateLimiter: Limit '{}' set to {} per {}s", key, max_tokens, interval_seconds);
}

bool RateLimiter::has_limit(const std::string& key) const {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    return buckets_.find(key) != buckets_.end();
}

bool RateLimiter::limit(const std::string& key, double tokens, bool block,
                        std::optional<Seconds> timeout) {
    auto bucket = find_bucket(key);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_[key]++;
    }

    // Consume outside the registry lock; waiting here must not block other keys
    return bucket->consume(tokens, block, timeout);
}

std::map<std::string, RateLimitInfo> RateLimiter::get_limits() const {
    std::map<std::string, std::shared_ptr<TokenBucket>> buckets;
    {
        std::lock_guard<std::mutex> lock(buckets_mutex_);
        buckets = buckets_;
    }

    std::map<std::string, RateLimitInfo> limits;
    for (const auto& [key, bucket] : buckets) {
        RateLimitInfo info;
        info.max_tokens = bucket->max_tokens();
        info.refill_rate = bucket->refill_rate();
        info.current_tokens = bucket->get_token_count();
        limits.emplace(key, info);
    }

    return limits;
}

std::map<std::string, uint64_t> RateLimiter::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void RateLimiter::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.clear();
}

double RateLimiter::get_token_count(const std::string& key) const {
    std::shared_ptr<TokenBucket> bucket;
    {
        std::lock_guard<std::mutex> lock(buckets_mutex_);
        auto it = buckets_.find(key);
        if (it == buckets_.end()) {
            return 0.0;
        }
        bucket = it->second;
    }

    return bucket->get_token_count();
}

std::shared_ptr<TokenBucket> RateLimiter::find_bucket(const std::string& key) const {
    std::lock_guard<std::mutex> lock(buckets_mutex_);

    auto it = buckets_.find(key);
    if (it != buckets_.end()) {
        return it->second;
    }

    spdlog::warn("RateLimiter: Limit key '{}' not found, using default", key);
    return buckets_.at(DEFAULT_LIMIT_KEY);
}

} // namespace tradeguard
