/**
 * @file token_bucket.cpp
 * @brief Token bucket implementation
 */

#include "utils/token_bucket.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <thread>

namespace tradeguard {

TokenBucket::TokenBucket(double max_tokens, double refill_rate,
                         std::optional<double> initial_tokens)
    : max_tokens_(max_tokens)
    , refill_rate_(refill_rate)
    , tokens_(initial_tokens.value_or(max_tokens))
    , last_refill_time_(SteadyClock::now()) {

    if (!(max_tokens > 0.0)) {
        throw std::invalid_argument("TokenBucket: max_tokens must be > 0, got " +
                                    std::to_string(max_tokens));
    }

    if (!(refill_rate > 0.0)) {
        throw std::invalid_argument("TokenBucket: refill_rate must be > 0, got " +
                                    std::to_string(refill_rate));
    }

    if (tokens_ < 0.0 || tokens_ > max_tokens_) {
        throw std::invalid_argument("TokenBucket: initial tokens out of range");
    }

    spdlog::debug("TokenBucket: Created with capacity {}, rate {} tokens/sec",
                 max_tokens_, refill_rate_);
}

bool TokenBucket::consume(double tokens, bool block, std::optional<Seconds> timeout) {
    if (!(tokens > 0.0)) {
        throw std::invalid_argument("TokenBucket: requested tokens must be > 0");
    }

    auto start = SteadyClock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    refill();

    if (tokens_ >= tokens) {
        tokens_ -= tokens;
        return true;
    }

    if (tokens > max_tokens_) {
        spdlog::warn("TokenBucket: Request for {} tokens exceeds capacity {}",
                    tokens, max_tokens_);
        return false;
    }

    if (!block) {
        spdlog::debug("TokenBucket: Rate limit hit, not enough tokens ({:.2f}/{})",
                     tokens_, tokens);
        return false;
    }

    double deficit = tokens - tokens_;
    Seconds wait_time(deficit / refill_rate_);

    if (timeout && wait_time > *timeout) {
        spdlog::debug("TokenBucket: Rate limit hit, wait {:.3f}s exceeds timeout {:.3f}s",
                     wait_time.count(), timeout->count());
        return false;
    }

    spdlog::debug("TokenBucket: Rate limit hit, waiting {:.3f}s for refill", wait_time.count());

    // Lock stays held across the sleep
    std::this_thread::sleep_for(wait_time);

    refill();
    tokens_ = std::max(0.0, tokens_ - tokens);

    spdlog::debug("TokenBucket: Resumed after {:.3f}s",
                 Seconds(SteadyClock::now() - start).count());
    return true;
}

double TokenBucket::get_token_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    return tokens_;
}

void TokenBucket::refill() const {
    auto now = SteadyClock::now();
    double elapsed = Seconds(now - last_refill_time_).count();

    if (elapsed <= 0.0) {
        return;
    }

    tokens_ = std::min(max_tokens_, tokens_ + elapsed * refill_rate_);
    last_refill_time_ = now;
}

} // namespace tradeguard
