/**
 * @file metrics_sink.cpp
 * @brief In-memory metrics sink implementation
 */

#include "metrics/metrics_sink.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace tradeguard {

InMemoryMetricsSink::InMemoryMetricsSink(size_t max_points)
    : max_points_(max_points) {
    if (max_points_ == 0) {
        throw std::invalid_argument("InMemoryMetricsSink: max_points must be > 0");
    }
}

void InMemoryMetricsSink::write(const MetricPoint& point) {
    std::lock_guard<std::mutex> lock(mutex_);

    latest_[point.category][point.name] = point.value;

    auto& history = history_[point.full_name()];
    history.push_back(point);
    while (history.size() > max_points_) {
        history.pop_front();
    }
}

std::optional<double> InMemoryMetricsSink::get_latest(const std::string& category,
                                                      const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto category_it = latest_.find(category);
    if (category_it == latest_.end()) {
        return std::nullopt;
    }

    auto it = category_it->second.find(name);
    if (it == category_it->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, std::map<std::string, double>> InMemoryMetricsSink::get_metrics(
    const std::string& category) const {

    std::lock_guard<std::mutex> lock(mutex_);

    if (category.empty()) {
        return latest_;
    }

    std::map<std::string, std::map<std::string, double>> result;
    auto it = latest_.find(category);
    if (it != latest_.end()) {
        result.emplace(it->first, it->second);
    }
    return result;
}

std::vector<MetricPoint> InMemoryMetricsSink::get_history(const std::string& category,
                                                          const std::string& name,
                                                          size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = history_.find(category + "." + name);
    if (it == history_.end()) {
        return {};
    }

    const auto& points = it->second;
    size_t count = (limit == 0) ? points.size() : std::min(limit, points.size());
    return std::vector<MetricPoint>(points.end() - static_cast<std::ptrdiff_t>(count), points.end());
}

MetricStatistics InMemoryMetricsSink::get_statistics(const std::string& category,
                                                     const std::string& name,
                                                     uint64_t since_ns) const {
    std::lock_guard<std::mutex> lock(mutex_);

    MetricStatistics stats;
    auto it = history_.find(category + "." + name);
    if (it == history_.end()) {
        return stats;
    }

    double sum = 0.0;
    stats.min = std::numeric_limits<double>::max();
    stats.max = std::numeric_limits<double>::lowest();

    for (const auto& point : it->second) {
        if (point.timestamp_ns < since_ns) {
            continue;
        }
        stats.min = std::min(stats.min, point.value);
        stats.max = std::max(stats.max, point.value);
        sum += point.value;
        stats.count++;
    }

    if (stats.count == 0) {
        return MetricStatistics{};
    }

    stats.avg = sum / static_cast<double>(stats.count);
    return stats;
}

void InMemoryMetricsSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_.clear();
    history_.clear();
}

} // namespace tradeguard
