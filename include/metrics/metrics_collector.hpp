/**
 * @file metrics_collector.hpp
 * @brief Periodic collection of resilience metrics
 *
 * Samples the rate limiter, circuit breakers, API call guard and failover
 * manager on a fixed interval, keeps the latest value and a bounded
 * history of each metric, and forwards every point to the registered
 * sinks.
 *
 * **Collected Metrics:**
 * - api.calls_total: sum of RateLimiter::get_stats()
 * - api.calls_class.<key>: limit() calls per rate limit key
 * - api.open_circuits, api.half_open_circuits
 * - api.calls_successful, api.calls_failed, api.rate_limit_hits,
 *   api.circuit_rejections, api.retries (guard attached)
 * - api.latency_avg_us, api.latency_max_us, api.latency_p99_us (guard attached)
 * - failover.state: numeric FailoverState
 * - failover.unhealthy_components: components not HEALTHY
 * - failover.shutdown_triggered: 0 or 1
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "exchange/guarded_exchange_api.hpp"
#include "failover/failover_manager.hpp"
#include "metrics/metrics_sink.hpp"
#include "resilience/circuit_breaker_registry.hpp"
#include "utils/rate_limiter.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tradeguard {

/**
 * @brief Metrics collection settings
 */
struct MetricsCollectorConfig {
    bool enabled{true};                   ///< Run the collection loop
    Seconds collection_interval{10.0};    ///< Loop period
    size_t max_points{10000};             ///< History length per metric
};

/**
 * @brief Metrics collection loop
 *
 * Sources are optional; a source that was never attached is skipped.
 * Sink failures are logged and never stop collection.
 *
 * **Usage Pattern:**
 * 1. Attach the sources and sinks
 * 2. start() the loop, or drive collect_once() from an existing loop
 * 3. Record application metrics with update_metric()
 * 4. Read back with get_metrics() / get_metric_history()
 *
 * @code
 * MetricsCollector metrics(config.metrics);
 * metrics.attach_rate_limiter(limiter);
 * metrics.attach_circuit_breakers(breakers);
 * metrics.attach_failover_manager(failover);
 * metrics.add_sink(recorder);
 *
 * metrics.start();
 * metrics.update_metric("trading", "signals_generated", 12);
 *
 * auto api = metrics.get_metrics("api");
 * std::cout << "open circuits: " << api["api"]["open_circuits"] << '\n';
 * @endcode
 *
 * @note Thread-safe
 */
class MetricsCollector {
public:
    /**
     * @throws std::invalid_argument if collection_interval is not positive
     *         or max_points is 0
     */
    explicit MetricsCollector(const MetricsCollectorConfig& config = MetricsCollectorConfig{});

    ~MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void attach_rate_limiter(std::shared_ptr<const RateLimiter> limiter);
    void attach_circuit_breakers(std::shared_ptr<const CircuitBreakerRegistry> breakers);
    void attach_api_guard(std::shared_ptr<const GuardedExchangeApi> guard);
    void attach_failover_manager(std::shared_ptr<const FailoverManager> failover);

    /**
     * @brief Forward every future point to a sink
     */
    void add_sink(std::shared_ptr<MetricsSink> sink);

    /**
     * @brief Start the collection thread
     *
     * @return bool False if disabled or already running
     */
    bool start();

    /**
     * @brief Stop the collection thread
     *
     * Wakes the loop, joins it, then flushes every sink.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Sample every attached source once
     */
    void collect_once();

    /**
     * @brief Record a value
     *
     * Stored in the in-memory history and forwarded to every sink.
     */
    void update_metric(const std::string& category, const std::string& name,
                       double value, const MetricTags& tags = MetricTags{});

    /**
     * @brief Latest values, category -> name -> value
     *
     * @param category Restrict to one category (empty = all)
     */
    std::map<std::string, std::map<std::string, double>> get_metrics(
        const std::string& category = "") const;

    std::vector<MetricPoint> get_metric_history(const std::string& category,
                                                const std::string& name,
                                                size_t limit = 100) const;

    /**
     * @brief Min/max/avg of a metric over the last @p period
     */
    MetricStatistics get_metric_statistics(const std::string& category,
                                           const std::string& name,
                                           Seconds period = Seconds(86400.0)) const;

    /**
     * @brief Number of collection cycles completed
     */
    uint64_t get_collection_count() const { return collection_count_.load(); }

    const MetricsCollectorConfig& config() const { return config_; }

private:
    const MetricsCollectorConfig config_;
    InMemoryMetricsSink store_;

    mutable std::mutex sources_mutex_;                        ///< Protects sources and sinks
    std::shared_ptr<const RateLimiter> limiter_;
    std::shared_ptr<const CircuitBreakerRegistry> breakers_;
    std::shared_ptr<const GuardedExchangeApi> guard_;
    std::shared_ptr<const FailoverManager> failover_;
    std::vector<std::shared_ptr<MetricsSink>> sinks_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> collection_count_{0};
    std::unique_ptr<std::thread> collection_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    void collection_loop();

    void collect_rate_limiter(const RateLimiter& limiter);
    void collect_circuit_breakers(const CircuitBreakerRegistry& breakers);
    void collect_api_guard(const GuardedExchangeApi& guard);
    void collect_failover(const FailoverManager& failover);

    void flush_sinks();
};

} // namespace tradeguard
