/**
 * @file metrics_sink.hpp
 * @brief Metric points and the sinks that receive them
 *
 * **Naming:**
 * Metrics are addressed by category and name ("api" / "calls_total"),
 * written together as "api.calls_total".
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {

/// Free-form point labels
using MetricTags = std::map<std::string, std::string>;

/**
 * @brief One sampled metric value
 */
struct MetricPoint {
    std::string category;     ///< Metric family ("api", "failover", ...)
    std::string name;         ///< Metric name within the family
    double value{0.0};        ///< Sampled value
    uint64_t timestamp_ns{0}; ///< Wall clock nanoseconds since epoch
    MetricTags tags;          ///< Optional labels

    std::string full_name() const { return category + "." + name; }
};

/**
 * @brief Destination of metric points
 *
 * Implementations may throw from write() or flush(); MetricsCollector
 * logs and drops such failures.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void write(const MetricPoint& point) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Min/max/avg over a metric's retained history
 */
struct MetricStatistics {
    double min{0.0};
    double max{0.0};
    double avg{0.0};
    size_t count{0};
};

/**
 * @brief Sink keeping the latest value and a bounded history per metric
 *
 * History is a ring of the last max_points values of each metric; older
 * points are dropped.
 *
 * @code
 * InMemoryMetricsSink store(10000);
 * store.write({"api", "open_circuits", 1.0, get_timestamp_ns(), {}});
 *
 * auto latest = store.get_latest("api", "open_circuits");   // 1.0
 * auto last10 = store.get_history("api", "open_circuits", 10);
 * @endcode
 *
 * @note Thread-safe
 */
class InMemoryMetricsSink : public MetricsSink {
public:
    /**
     * @param max_points History length per metric (must be > 0)
     *
     * @throws std::invalid_argument if max_points is 0
     */
    explicit InMemoryMetricsSink(size_t max_points = 10000);

    void write(const MetricPoint& point) override;
    void flush() override {}

    /**
     * @brief Latest value of a metric
     *
     * @return std::optional<double> Empty if never written
     */
    std::optional<double> get_latest(const std::string& category, const std::string& name) const;

    /**
     * @brief Latest values, category -> name -> value
     *
     * @param category Restrict to one category (empty = all)
     */
    std::map<std::string, std::map<std::string, double>> get_metrics(
        const std::string& category = "") const;

    /**
     * @brief Most recent points of a metric, oldest first
     *
     * @param limit Maximum number of points (0 = all retained)
     */
    std::vector<MetricPoint> get_history(const std::string& category, const std::string& name,
                                         size_t limit = 100) const;

    /**
     * @brief Statistics over the retained points of a metric
     *
     * @param since_ns Only points at or after this timestamp (0 = all)
     */
    MetricStatistics get_statistics(const std::string& category, const std::string& name,
                                    uint64_t since_ns = 0) const;

    size_t max_points() const { return max_points_; }

    void clear();

private:
    const size_t max_points_;

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, double>> latest_;   ///< category -> name -> value
    std::map<std::string, std::deque<MetricPoint>> history_;        ///< full name -> points
};

} // namespace tradeguard
