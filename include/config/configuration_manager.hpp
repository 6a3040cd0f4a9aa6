/**
 * @file configuration_manager.hpp
 * @brief YAML-based configuration of the resilience layer
 *
 * Loads every tunable of the rate limiter, circuit breakers, failover
 * manager, API call guard, metrics collection and logging from one YAML
 * document. Missing keys keep their defaults.
 *
 * **Features:**
 * - YAML parsing with per-key defaults
 * - Validation returning readable errors
 * - Reload with change notification
 * - ${ENV_VAR} substitution in string values
 *
 * **Example Document:**
 * ```yaml
 * rate_limits:
 *   order: {max_tokens: 50, interval: 10}
 * circuit_breaker: {error_threshold: 5, error_timeout: 60, circuit_timeout: 300}
 * failover: {check_interval: 30, max_recovery_attempts: 3, recovery_backoff: 60}
 * api:
 *   max_retries: 3
 *   retry_delay: 5
 *   method_limits: {place_order: order, get_positions: position}
 * metrics: {collection_interval: 10, output_file: "${DATA_DIR}/metrics.csv"}
 * logging: {level: info, log_file: logs/tradeguard.log}
 * ```
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "exchange/guarded_exchange_api.hpp"
#include "failover/failover_manager.hpp"
#include "metrics/metrics_collector.hpp"
#include "resilience/circuit_breaker.hpp"
#include "utils/logging.hpp"
#include "utils/rate_limiter.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tradeguard {

/**
 * @brief Metrics collection and recording configuration
 */
struct MetricsConfig {
    bool enabled{true};                   ///< Run the collection loop
    double collection_interval{10.0};     ///< Seconds between collections
    size_t max_points{10000};             ///< In-memory history per metric
    std::string output_file;              ///< Recorder file (empty = no recorder)
    std::string format{"csv"};            ///< csv|json

    MetricsCollectorConfig to_collector_config() const {
        MetricsCollectorConfig config;
        config.enabled = enabled;
        config.collection_interval = Seconds(collection_interval);
        config.max_points = max_points;
        return config;
    }
};

/**
 * @brief Complete configuration
 */
struct SystemConfig {
    RateLimitTable rate_limits = default_rate_limits(); ///< Rate limit key -> budget
    CircuitBreakerConfig circuit_breaker;               ///< Breaker defaults
    FailoverConfig failover;                            ///< Failover manager
    ApiGuardConfig api;                                 ///< API call guard
    MetricsConfig metrics;                              ///< Metrics collection
    LoggingConfig logging;                              ///< Logging
};

/**
 * @brief Configuration manager
 *
 * A document that fails to parse leaves the current configuration
 * untouched.
 *
 * @code
 * ConfigurationManager config;
 * if (!config.load("tradeguard.yaml")) {
 *     spdlog::warn("Using default configuration");
 * }
 *
 * auto errors = config.validate();
 * for (const auto& error : errors) {
 *     spdlog::error("Config: {}", error);
 * }
 *
 * auto limiter = std::make_shared<RateLimiter>(config.get_config().rate_limits);
 * @endcode
 *
 * @note Thread-safe
 */
class ConfigurationManager {
public:
    /**
     * @brief Callback for configuration changes
     */
    using ConfigChangeCallback = std::function<void(const SystemConfig&)>;

    /**
     * @brief Construct with create_default()
     */
    ConfigurationManager();

    /**
     * @brief Load configuration from a YAML file
     *
     * Invokes the change callback on success.
     *
     * @param filename YAML file path
     * @return bool True if loaded successfully
     */
    bool load(const std::string& filename);

    /**
     * @brief Load configuration from a YAML string
     *
     * @param yaml_content YAML content
     * @return bool True if parsed successfully
     */
    bool load_from_string(const std::string& yaml_content);

    /**
     * @brief Save configuration to a YAML file
     *
     * @param filename Output file path
     * @return bool True if saved successfully
     */
    bool save(const std::string& filename) const;

    SystemConfig get_config() const;

    /**
     * @brief Replace the configuration programmatically
     *
     * Invokes the change callback.
     */
    void set_config(const SystemConfig& config);

    /**
     * @brief Validate the current configuration
     *
     * @return std::vector<std::string> Errors (empty if valid)
     */
    std::vector<std::string> validate() const;

    void set_change_callback(ConfigChangeCallback callback);

    /**
     * @brief Load the last loaded file again
     *
     * @return bool False if no file was loaded or loading fails
     */
    bool reload();

    std::string get_filename() const;

    /**
     * @brief Built-in defaults
     */
    static SystemConfig create_default();

    /**
     * @brief Write the defaults to a file as a starting point
     */
    static bool create_example(const std::string& filename);

    /**
     * @brief Validate a configuration
     */
    static std::vector<std::string> validate_config(const SystemConfig& config);

private:
    mutable std::mutex mutex_;              ///< Protects the members below
    SystemConfig config_;                   ///< Current configuration
    std::string filename_;                  ///< Last loaded file
    ConfigChangeCallback change_callback_;  ///< Change callback

    /**
     * @brief Parse YAML over a copy of the current configuration
     *
     * @param yaml_content Document
     * @param config In: base values, out: parsed configuration
     * @return bool False on parse error (config unspecified)
     */
    static bool parse_yaml(const std::string& yaml_content, SystemConfig& config);

    static std::string substitute_env_vars(const std::string& value);

    void notify_change(const SystemConfig& config);
};

} // namespace tradeguard
