/**
 * @file api_call_metrics.hpp
 * @brief Counters and latency distribution for guarded API calls
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "metrics/latency_histogram.hpp"
#include <atomic>
#include <cstdint>

namespace tradeguard {

/**
 * @brief Aggregate view of ApiCallMetrics
 */
struct ApiCallSummary {
    uint64_t total_calls;        ///< Calls entering the guard
    uint64_t successful_calls;   ///< Calls that returned OK
    uint64_t failed_calls;       ///< API errors and final exceptions
    uint64_t rate_limited;       ///< Rejected by the rate limiter
    uint64_t circuit_rejected;   ///< Rejected by an open circuit
    uint64_t retries;            ///< Extra attempts after exceptions
    double latency_avg_us;       ///< Mean latency of calls reaching the API
    uint64_t latency_max_us;     ///< Slowest call
    uint64_t latency_p50_us;     ///< Median latency
    uint64_t latency_p95_us;     ///< p95 latency
    uint64_t latency_p99_us;     ///< p99 latency
};

/**
 * @brief Lock-free metrics for the API call guard
 *
 * Latency is recorded only for calls that reached the remote API, from the
 * first attempt to the final outcome (retry sleeps included).
 *
 * @code
 * auto summary = guard.metrics().get_summary();
 * spdlog::info("API: {} calls, {} failed, p99 {}us",
 *              summary.total_calls, summary.failed_calls, summary.latency_p99_us);
 * @endcode
 *
 * @note Thread-safe
 */
class ApiCallMetrics {
public:
    void increment_total() { total_calls_.fetch_add(1, std::memory_order_relaxed); }
    void increment_success() { successful_calls_.fetch_add(1, std::memory_order_relaxed); }
    void increment_failure() { failed_calls_.fetch_add(1, std::memory_order_relaxed); }
    void increment_rate_limited() { rate_limited_.fetch_add(1, std::memory_order_relaxed); }
    void increment_circuit_rejected() { circuit_rejected_.fetch_add(1, std::memory_order_relaxed); }
    void increment_retries() { retries_.fetch_add(1, std::memory_order_relaxed); }

    void record_latency_us(uint64_t latency_us) { latency_us_.record(latency_us); }

    uint64_t get_total_calls() const { return total_calls_.load(std::memory_order_acquire); }
    uint64_t get_successful_calls() const { return successful_calls_.load(std::memory_order_acquire); }
    uint64_t get_failed_calls() const { return failed_calls_.load(std::memory_order_acquire); }
    uint64_t get_rate_limited() const { return rate_limited_.load(std::memory_order_acquire); }
    uint64_t get_circuit_rejected() const { return circuit_rejected_.load(std::memory_order_acquire); }
    uint64_t get_retries() const { return retries_.load(std::memory_order_acquire); }

    const LatencyHistogram<>& latency() const { return latency_us_; }

    ApiCallSummary get_summary() const {
        ApiCallSummary summary;
        summary.total_calls = get_total_calls();
        summary.successful_calls = get_successful_calls();
        summary.failed_calls = get_failed_calls();
        summary.rate_limited = get_rate_limited();
        summary.circuit_rejected = get_circuit_rejected();
        summary.retries = get_retries();
        summary.latency_avg_us = latency_us_.get_average();
        summary.latency_max_us = latency_us_.get_max();
        summary.latency_p50_us = latency_us_.get_percentile(50);
        summary.latency_p95_us = latency_us_.get_percentile(95);
        summary.latency_p99_us = latency_us_.get_percentile(99);
        return summary;
    }

    /**
     * @brief Reset all counters and the histogram
     *
     * @warning Not safe while calls are in flight
     */
    void reset() {
        total_calls_.store(0, std::memory_order_release);
        successful_calls_.store(0, std::memory_order_release);
        failed_calls_.store(0, std::memory_order_release);
        rate_limited_.store(0, std::memory_order_release);
        circuit_rejected_.store(0, std::memory_order_release);
        retries_.store(0, std::memory_order_release);
        latency_us_.reset();
    }

private:
    LatencyHistogram<> latency_us_;

    alignas(64) std::atomic<uint64_t> total_calls_{0};
    alignas(64) std::atomic<uint64_t> successful_calls_{0};
    alignas(64) std::atomic<uint64_t> failed_calls_{0};
    alignas(64) std::atomic<uint64_t> rate_limited_{0};
    alignas(64) std::atomic<uint64_t> circuit_rejected_{0};
    alignas(64) std::atomic<uint64_t> retries_{0};
};

} // namespace tradeguard
