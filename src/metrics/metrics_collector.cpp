/**
 * @file metrics_collector.cpp
 * @brief Metrics collector implementation
 */

#include "metrics/metrics_collector.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace tradeguard {

MetricsCollector::MetricsCollector(const MetricsCollectorConfig& config)
    : config_(config)
    , store_(config.max_points) {

    if (config_.collection_interval.count() <= 0.0) {
        throw std::invalid_argument("MetricsCollector: collection_interval must be > 0");
    }
}

MetricsCollector::~MetricsCollector() {
    stop();
}

void MetricsCollector::attach_rate_limiter(std::shared_ptr<const RateLimiter> limiter) {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    limiter_ = std::move(limiter);
}

void MetricsCollector::attach_circuit_breakers(std::shared_ptr<const CircuitBreakerRegistry> breakers) {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    breakers_ = std::move(breakers);
}

void MetricsCollector::attach_api_guard(std::shared_ptr<const GuardedExchangeApi> guard) {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    guard_ = std::move(guard);
}

void MetricsCollector::attach_failover_manager(std::shared_ptr<const FailoverManager> failover) {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    failover_ = std::move(failover);
}

void MetricsCollector::add_sink(std::shared_ptr<MetricsSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sources_mutex_);
    sinks_.push_back(std::move(sink));
}

bool MetricsCollector::start() {
    if (!config_.enabled) {
        spdlog::info("MetricsCollector: Disabled by configuration, not starting");
        return false;
    }

    if (running_.exchange(true)) {
        spdlog::warn("MetricsCollector: Already running");
        return false;
    }

    collection_thread_ = std::make_unique<std::thread>(&MetricsCollector::collection_loop, this);

    spdlog::info("MetricsCollector: Started (interval {}s)", config_.collection_interval.count());
    return true;
}

void MetricsCollector::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false) && !collection_thread_) {
            return;
        }
    }
    wake_cv_.notify_all();

    if (collection_thread_ && collection_thread_->joinable()) {
        collection_thread_->join();
    }
    collection_thread_.reset();

    flush_sinks();
    spdlog::info("MetricsCollector: Stopped after {} collections", collection_count_.load());
}

void MetricsCollector::collection_loop() {
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.collection_interval);

    while (running_) {
        try {
            collect_once();
        } catch (const std::exception& e) {
            spdlog::error("MetricsCollector: Error in metrics collection: {}", e.what());
        } catch (...) {
            spdlog::error("MetricsCollector: Error in metrics collection: unknown exception");
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, interval, [this]() { return !running_.load(); });
    }
}

void MetricsCollector::collect_once() {
    std::shared_ptr<const RateLimiter> limiter;
    std::shared_ptr<const CircuitBreakerRegistry> breakers;
    std::shared_ptr<const GuardedExchangeApi> guard;
    std::shared_ptr<const FailoverManager> failover;
    {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        limiter = limiter_;
        breakers = breakers_;
        guard = guard_;
        failover = failover_;
    }

    if (limiter) {
        collect_rate_limiter(*limiter);
    }
    if (breakers) {
        collect_circuit_breakers(*breakers);
    }
    if (guard) {
        collect_api_guard(*guard);
    }
    if (failover) {
        collect_failover(*failover);
    }

    collection_count_.fetch_add(1);
}

void MetricsCollector::collect_rate_limiter(const RateLimiter& limiter) {
    auto stats = limiter.get_stats();

    uint64_t total = 0;
    for (const auto& [key, count] : stats) {
        total += count;
        update_metric("api", "calls_class." + key, static_cast<double>(count), {{"limit_key", key}});
    }

    update_metric("api", "calls_total", static_cast<double>(total));
}

void MetricsCollector::collect_circuit_breakers(const CircuitBreakerRegistry& breakers) {
    update_metric("api", "open_circuits",
                  static_cast<double>(breakers.count_in_state(CircuitState::OPEN)));
    update_metric("api", "half_open_circuits",
                  static_cast<double>(breakers.count_in_state(CircuitState::HALF_OPEN)));
}

void MetricsCollector::collect_api_guard(const GuardedExchangeApi& guard) {
    auto summary = guard.metrics().get_summary();

    update_metric("api", "calls_successful", static_cast<double>(summary.successful_calls));
    update_metric("api", "calls_failed", static_cast<double>(summary.failed_calls));
    update_metric("api", "rate_limit_hits", static_cast<double>(summary.rate_limited));
    update_metric("api", "circuit_rejections", static_cast<double>(summary.circuit_rejected));
    update_metric("api", "retries", static_cast<double>(summary.retries));
    update_metric("api", "latency_avg_us", summary.latency_avg_us);
    update_metric("api", "latency_max_us", static_cast<double>(summary.latency_max_us));
    update_metric("api", "latency_p99_us", static_cast<double>(summary.latency_p99_us));
}

void MetricsCollector::collect_failover(const FailoverManager& failover) {
    auto status = failover.get_failover_status();

    size_t unhealthy = 0;
    for (const auto& [name, component] : status.components) {
        if (component.status != ComponentStatus::HEALTHY) {
            unhealthy++;
        }
    }

    update_metric("failover", "state", static_cast<double>(static_cast<int>(status.state)),
                  {{"state", failover_state_to_string(status.state)}});
    update_metric("failover", "unhealthy_components", static_cast<double>(unhealthy));
    update_metric("failover", "shutdown_triggered", status.shutdown_triggered ? 1.0 : 0.0);
}

void MetricsCollector::update_metric(const std::string& category, const std::string& name,
                                     double value, const MetricTags& tags) {
    MetricPoint point;
    point.category = category;
    point.name = name;
    point.value = value;
    point.timestamp_ns = get_timestamp_ns();
    point.tags = tags;

    store_.write(point);

    std::vector<std::shared_ptr<MetricsSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        try {
            sink->write(point);
        } catch (const std::exception& e) {
            spdlog::warn("MetricsCollector: Sink failed to store {}: {}", point.full_name(), e.what());
        } catch (...) {
            spdlog::warn("MetricsCollector: Sink failed to store {}: unknown exception", point.full_name());
        }
    }
}

std::map<std::string, std::map<std::string, double>> MetricsCollector::get_metrics(
    const std::string& category) const {
    return store_.get_metrics(category);
}

std::vector<MetricPoint> MetricsCollector::get_metric_history(const std::string& category,
                                                              const std::string& name,
                                                              size_t limit) const {
    return store_.get_history(category, name, limit);
}

MetricStatistics MetricsCollector::get_metric_statistics(const std::string& category,
                                                         const std::string& name,
                                                         Seconds period) const {
    auto period_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(period).count();
    uint64_t now = get_timestamp_ns();
    uint64_t since = (period_ns > 0 && static_cast<uint64_t>(period_ns) < now)
        ? now - static_cast<uint64_t>(period_ns)
        : 0;

    return store_.get_statistics(category, name, since);
}

void MetricsCollector::flush_sinks() {
    std::vector<std::shared_ptr<MetricsSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sources_mutex_);
        sinks = sinks_;
    }

    for (const auto& sink : sinks) {
        try {
            sink->flush();
        } catch (const std::exception& e) {
            spdlog::warn("MetricsCollector: Sink flush failed: {}", e.what());
        } catch (...) {
            spdlog::warn("MetricsCollector: Sink flush failed: unknown exception");
        }
    }
}

} // namespace tradeguard
