/**
 * @file latency_histogram.hpp
 * @brief Lock-free logarithmic histogram for call latencies
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>

namespace tradeguard {

/**
 * @brief Lock-free histogram with logarithmic buckets
 *
 * Values are bucketed by log2(value) * 10, so each power of two is split
 * into ten buckets. Percentiles are approximate to that resolution; min,
 * max, count and average are exact.
 *
 * **Performance:**
 * - record(): O(1), a few relaxed atomics plus CAS for min/max
 * - get_percentile(): O(NUM_BUCKETS) scan
 *
 * @tparam NUM_BUCKETS Number of buckets (640 covers the full uint64_t range)
 *
 * @code
 * LatencyHistogram<> call_latency_us;
 *
 * call_latency_us.record(elapsed_us);
 *
 * spdlog::info("p99 {}us, max {}us", call_latency_us.get_percentile(99),
 *              call_latency_us.get_max());
 * @endcode
 *
 * @note record() is safe from any number of threads
 * @warning reset() must not race with record()
 */
template<size_t NUM_BUCKETS = 640>
class LatencyHistogram {
public:
    LatencyHistogram() {
        reset();
    }

    void record(uint64_t value) {
        buckets_[value_to_bucket(value)].fetch_add(1, std::memory_order_relaxed);

        uint64_t current_min = min_value_.load(std::memory_order_relaxed);
        while (value < current_min &&
               !min_value_.compare_exchange_weak(current_min, value,
                                                  std::memory_order_relaxed)) {}

        uint64_t current_max = max_value_.load(std::memory_order_relaxed);
        while (value > current_max &&
               !max_value_.compare_exchange_weak(current_max, value,
                                                  std::memory_order_relaxed)) {}

        count_.fetch_add(1, std::memory_order_relaxed);
        sum_.fetch_add(value, std::memory_order_relaxed);
    }

    /**
     * @brief Approximate value at a percentile
     *
     * Never exceeds the recorded maximum.
     *
     * @param percentile Percentile in [0, 100]
     * @return uint64_t Value, or 0 if empty
     */
    uint64_t get_percentile(double percentile) const {
        uint64_t total = count_.load(std::memory_order_acquire);
        if (total == 0) {
            return 0;
        }

        double clamped = std::clamp(percentile, 0.0, 100.0);
        uint64_t target = static_cast<uint64_t>(std::ceil(total * clamped / 100.0));
        target = std::max<uint64_t>(target, 1);

        uint64_t cumulative = 0;
        for (size_t i = 0; i < NUM_BUCKETS; ++i) {
            cumulative += buckets_[i].load(std::memory_order_acquire);
            if (cumulative >= target) {
                return std::min(bucket_to_value(i), get_max());
            }
        }

        return get_max();
    }

    double get_average() const {
        uint64_t total = count_.load(std::memory_order_acquire);
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(sum_.load(std::memory_order_acquire)) /
               static_cast<double>(total);
    }

    uint64_t get_min() const {
        uint64_t min = min_value_.load(std::memory_order_acquire);
        return min == std::numeric_limits<uint64_t>::max() ? 0 : min;
    }

    uint64_t get_max() const {
        return max_value_.load(std::memory_order_acquire);
    }

    uint64_t get_count() const {
        return count_.load(std::memory_order_acquire);
    }

    void reset() {
        for (auto& bucket : buckets_) {
            bucket.store(0, std::memory_order_relaxed);
        }
        min_value_.store(std::numeric_limits<uint64_t>::max(), std::memory_order_relaxed);
        max_value_.store(0, std::memory_order_relaxed);
        count_.store(0, std::memory_order_relaxed);
        sum_.store(0, std::memory_order_relaxed);
    }

private:
    static size_t value_to_bucket(uint64_t value) {
        if (value == 0) {
            return 0;
        }
        auto bucket = static_cast<size_t>(std::log2(static_cast<double>(value)) * 10.0);
        return std::min(bucket, NUM_BUCKETS - 1);
    }

    // Upper edge of the bucket, so percentiles err on the slow side
    static uint64_t bucket_to_value(size_t bucket) {
        return static_cast<uint64_t>(std::pow(2.0, static_cast<double>(bucket + 1) / 10.0));
    }

    std::array<std::atomic<uint64_t>, NUM_BUCKETS> buckets_;
    std::atomic<uint64_t> min_value_;
    std::atomic<uint64_t> max_value_;
    std::atomic<uint64_t> count_;
    std::atomic<uint64_t> sum_;
};

} // namespace tradeguard
