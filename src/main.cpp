/**
 * @file main.cpp
 * @brief Resilience layer demo against a simulated exchange
 *
 * Wires the rate limiter, circuit breakers, guarded API client, failover
 * manager and metrics collection together and drives them with simulated
 * trading traffic. The simulated exchange periodically goes through an
 * outage so circuits open, the failover manager escalates and recovery
 * runs.
 *
 * Usage: tradeguard_demo [config.yaml]
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#include "config/configuration_manager.hpp"
#include "exchange/guarded_exchange_api.hpp"
#include "failover/failover_manager.hpp"
#include "failover/health_checks.hpp"
#include "metrics/metrics_collector.hpp"
#include "network/status_formatter.hpp"
#include "persistence/metrics_recorder.hpp"
#include "resilience/circuit_breaker_registry.hpp"
#include "utils/logging.hpp"
#include "utils/rate_limiter.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>

using namespace tradeguard;

// Global shutdown flag
std::atomic<bool> shutdown_requested{false};

// Signal handler
void signal_handler(int signal) {
    std::cout << "\n\nShutdown signal received (" << signal << "). Stopping...\n";
    shutdown_requested.store(true);
}

/**
 * @brief Simulated exchange REST endpoint
 *
 * Answers every method with a small JSON body. A configurable share of
 * calls fails with an exchange error code or a transport exception, and
 * set_outage(true) makes every call fail.
 */
class SimulatedExchange : public ExchangeApi {
public:
    explicit SimulatedExchange(double failure_rate)
        : failure_rate_(failure_rate)
        , gen_(std::random_device{}())
        , dist_(0.0, 1.0) {
    }

    ApiResponse call(const std::string& method, const ApiParams& params) override {
        double roll;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            roll = dist_(gen_);
        }

        // Simulated network round trip
        std::this_thread::sleep_for(std::chrono::microseconds(200 + static_cast<int>(roll * 800)));

        if (outage_.load()) {
            ApiResponse response;
            response.code = 10006;
            response.message = "Service temporarily unavailable";
            return response;
        }

        if (roll < failure_rate_ * 0.2) {
            throw ApiError("Request timed out");
        }

        if (roll < failure_rate_) {
            ApiResponse response;
            response.code = 10002;
            response.message = "Request expired";
            return response;
        }

        ApiResponse response;
        if (method == "get_server_time") {
            response.body = "{\"timeSecond\":\"" + std::to_string(get_timestamp_ms() / 1000) + "\"}";
        } else {
            auto symbol = params.count("symbol") ? params.at("symbol") : std::string("BTCUSDT");
            response.body = "{\"method\":\"" + method + "\",\"symbol\":\"" + symbol + "\"}";
        }
        return response;
    }

    void set_outage(bool outage) { outage_.store(outage); }
    bool in_outage() const { return outage_.load(); }

private:
    const double failure_rate_;
    std::atomic<bool> outage_{false};
    std::mutex mutex_;
    std::mt19937 gen_;
    std::uniform_real_distribution<> dist_;
};

int main(int argc, char* argv[]) {
    try {
        // Load configuration
        ConfigurationManager config_manager;
        if (argc > 1 && !config_manager.load(argv[1])) {
            std::cerr << "Failed to load configuration from " << argv[1] << '\n';
            return 1;
        }

        auto errors = config_manager.validate();
        if (!errors.empty()) {
            for (const auto& error : errors) {
                std::cerr << "Config error: " << error << '\n';
            }
            return 1;
        }

        const auto config = config_manager.get_config();
        configure_logging(config.logging);

        std::cout << "\n";
        std::cout << "================================================================================\n";
        std::cout << "  TRADEGUARD - RESILIENCE LAYER DEMO\n";
        std::cout << "================================================================================\n\n";

        // Setup signal handlers
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // Rate limiting and circuit breaking
        auto limiter = std::make_shared<RateLimiter>(config.rate_limits);
        auto breakers = std::make_shared<CircuitBreakerRegistry>(config.circuit_breaker);

        auto exchange_ptr = std::make_unique<SimulatedExchange>(0.05);
        SimulatedExchange* exchange = exchange_ptr.get();
        auto api = std::make_shared<GuardedExchangeApi>(std::move(exchange_ptr), limiter, breakers, config.api);

        // Simulated data stream and strategy activity
        std::atomic<bool> stream_connected{true};
        std::atomic<int64_t> last_message_ns{static_cast<int64_t>(get_timestamp_ns())};
        std::atomic<int64_t> last_signal_ns{static_cast<int64_t>(get_timestamp_ns())};

        auto to_time_point = [](int64_t nanos) {
            return SystemClock::time_point(std::chrono::duration_cast<SystemClock::duration>(
                std::chrono::nanoseconds(nanos)));
        };

        // Metrics recording
        std::shared_ptr<MetricsRecorder> recorder;
        if (!config.metrics.output_file.empty()) {
            auto format = parse_recording_format(config.metrics.format).value_or(RecordingFormat::CSV);
            recorder = std::make_shared<MetricsRecorder>(config.metrics.output_file, format);
            if (!recorder->start()) {
                spdlog::warn("Demo: Metrics recording disabled");
                recorder.reset();
            }
        }

        // Failover supervision
        auto failover = std::make_shared<FailoverManager>(config.failover);

        failover->set_health_check(component::API_CLIENT, make_api_client_check(
            [api]() -> std::optional<int64_t> {
                auto response = api->call("get_server_time", {});
                if (!response.ok()) {
                    return std::nullopt;
                }
                return static_cast<int64_t>(get_timestamp_ms());
            },
            breakers));

        DataStreamProbes stream_probes;
        stream_probes.enabled = []() { return true; };
        stream_probes.healthy = [&stream_connected]() { return stream_connected.load(); };
        stream_probes.last_message = [&last_message_ns, to_time_point]() {
            return std::optional<SystemClock::time_point>(to_time_point(last_message_ns.load()));
        };
        failover->set_health_check(component::DATA_STREAM, make_data_stream_check(stream_probes));

        failover->set_health_check(component::STRATEGY_ENGINE, make_strategy_check(
            [&last_signal_ns, to_time_point]() {
                return std::optional<SystemClock::time_point>(to_time_point(last_signal_ns.load()));
            }));

        failover->set_health_check(component::ORDER_ENGINE, make_order_engine_check(
            [breakers]() {
                return breakers->get_circuit_breaker("place_order")->get_state() != CircuitState::OPEN;
            }));

        failover->set_health_check(component::PERSISTENCE, make_persistence_check(
            [&recorder]() { return !recorder || recorder->is_recording(); }));

        failover->set_recovery_function(component::API_CLIENT, [breakers, exchange]() {
            if (exchange->in_outage()) {
                return false;
            }
            breakers->reset_all();
            return true;
        });

        failover->set_recovery_function(component::DATA_STREAM, [&stream_connected, &last_message_ns]() {
            stream_connected.store(true);
            last_message_ns.store(static_cast<int64_t>(get_timestamp_ns()));
            return true;
        });

        failover->set_recovery_function(component::ORDER_ENGINE, [breakers, exchange]() {
            if (exchange->in_outage()) {
                return false;
            }
            breakers->get_circuit_breaker("place_order")->reset();
            return true;
        });

        failover->set_notifier([](const std::string& message) {
            spdlog::warn("Notification: {}", message);
        });

        failover->set_shutdown_handler([]() {
            spdlog::critical("Demo: Emergency shutdown requested by failover manager");
            shutdown_requested.store(true);
        });

        // Metrics collection
        auto collector = std::make_shared<MetricsCollector>(config.metrics.to_collector_config());
        collector->attach_rate_limiter(limiter);
        collector->attach_circuit_breakers(breakers);
        collector->attach_api_guard(api);
        collector->attach_failover_manager(failover);
        if (recorder) {
            collector->add_sink(recorder);
        }

        failover->start();
        collector->start();

        std::cout << "Simulated traffic: orders, positions and market data calls (10/sec)\n";
        std::cout << "Simulated outage: 15s every 60s\n";
        std::cout << "\nPress Ctrl+C to stop...\n\n";

        // Main traffic loop
        const std::vector<std::pair<std::string, ApiParams>> traffic = {
            {"get_ticker", {{"symbol", "BTCUSDT"}}},
            {"get_klines", {{"symbol", "BTCUSDT"}, {"interval", "1"}}},
            {"get_positions", {{"category", "linear"}}},
            {"place_order", {{"symbol", "BTCUSDT"}, {"side", "Buy"}, {"qty", "0.001"}}},
            {"get_wallet_balance", {{"accountType", "UNIFIED"}}},
        };

        auto start_time = std::chrono::steady_clock::now();
        auto last_status_time = start_time;
        size_t request_index = 0;

        while (!shutdown_requested.load()) {
            auto now = std::chrono::steady_clock::now();
            auto elapsed_sec = std::chrono::duration_cast<std::chrono::seconds>(now - start_time).count();

            // Outage from second 30 to 45 of every minute
            bool outage = (elapsed_sec % 60) >= 30 && (elapsed_sec % 60) < 45;
            if (outage != exchange->in_outage()) {
                spdlog::warn("Demo: Simulated exchange outage {}", outage ? "started" : "ended");
                exchange->set_outage(outage);
                stream_connected.store(!outage);
            }

            if (!outage) {
                last_message_ns.store(static_cast<int64_t>(get_timestamp_ns()));
            }

            const auto& [method, params] = traffic[request_index++ % traffic.size()];
            auto response = api->call(method, params);
            if (response.ok() && method == "get_klines") {
                last_signal_ns.store(static_cast<int64_t>(get_timestamp_ns()));
            }

            // Print status every 5 seconds
            if (std::chrono::duration_cast<std::chrono::seconds>(now - last_status_time).count() >= 5) {
                std::cout << StatusFormatter::format_failover_status(failover->get_failover_status()) << "\n";
                std::cout << StatusFormatter::format_circuit_states(breakers->get_all_states()) << "\n";
                std::cout << StatusFormatter::format_rate_limit_stats(limiter->get_stats()) << "\n";
                std::cout << StatusFormatter::format_api_metrics(api->metrics().get_summary()) << "\n\n";
                last_status_time = now;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        // Cleanup
        std::cout << "\nShutting down...\n";
        failover->stop();
        collector->stop();
        if (recorder) {
            recorder->stop();
        }

        std::cout << "\nStopped successfully.\n";
        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}
