/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "config/configuration_manager.hpp"
#include "persistence/metrics_recorder.hpp"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>

namespace tradeguard {

ConfigurationManager::ConfigurationManager() {
    config_ = create_default();
}

bool ConfigurationManager::load(const std::string& filename) {
    SystemConfig parsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            std::ifstream file(filename);
            if (!file.is_open()) {
                spdlog::error("ConfigurationManager: Failed to open file {}", filename);
                return false;
            }

            std::string content((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());

            parsed = config_;
            if (!parse_yaml(content, parsed)) {
                return false;
            }

            config_ = parsed;
            filename_ = filename;
            spdlog::info("ConfigurationManager: Loaded configuration from {}", filename);

        } catch (const std::exception& e) {
            spdlog::error("ConfigurationManager: Exception loading {}: {}", filename, e.what());
            return false;
        }
    }

    notify_change(parsed);
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    SystemConfig parsed = config_;
    if (!parse_yaml(yaml_content, parsed)) {
        return false;
    }

    config_ = parsed;
    return true;
}

bool ConfigurationManager::save(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        YAML::Emitter out;
        out << YAML::BeginMap;

        // Rate limits
        out << YAML::Key << "rate_limits";
        out << YAML::Value << YAML::BeginMap;
        for (const auto& [key, limit] : config_.rate_limits) {
            out << YAML::Key << key;
            out << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "max_tokens" << YAML::Value << limit.max_tokens;
            out << YAML::Key << "interval" << YAML::Value << limit.interval_seconds;
            out << YAML::EndMap;
        }
        out << YAML::EndMap;

        // Circuit breaker
        const auto& cb = config_.circuit_breaker;
        out << YAML::Key << "circuit_breaker";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "error_threshold" << YAML::Value << cb.error_threshold;
        out << YAML::Key << "error_timeout" << YAML::Value << cb.error_timeout.count();
        out << YAML::Key << "circuit_timeout" << YAML::Value << cb.circuit_timeout.count();
        out << YAML::Key << "single_probe" << YAML::Value << cb.single_probe;
        out << YAML::EndMap;

        // Failover
        const auto& fo = config_.failover;
        out << YAML::Key << "failover";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << fo.enabled;
        out << YAML::Key << "auto_recovery" << YAML::Value << fo.auto_recovery;
        out << YAML::Key << "max_recovery_attempts" << YAML::Value << fo.max_recovery_attempts;
        out << YAML::Key << "recovery_backoff" << YAML::Value << fo.recovery_backoff.count();
        out << YAML::Key << "emergency_shutdown" << YAML::Value << fo.emergency_shutdown;
        out << YAML::Key << "notification_enabled" << YAML::Value << fo.notification_enabled;
        out << YAML::Key << "check_interval" << YAML::Value << fo.check_interval.count();
        out << YAML::EndMap;

        // API
        const auto& api = config_.api;
        out << YAML::Key << "api";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_retries" << YAML::Value << api.max_retries;
        out << YAML::Key << "retry_delay" << YAML::Value << api.retry_delay.count();
        out << YAML::Key << "block_on_limit" << YAML::Value << api.block_on_limit;
        if (api.limit_timeout) {
            out << YAML::Key << "limit_timeout" << YAML::Value << api.limit_timeout->count();
        }
        out << YAML::Key << "method_limits" << YAML::Value << api.method_limits;
        out << YAML::EndMap;

        // Metrics
        const auto& metrics = config_.metrics;
        out << YAML::Key << "metrics";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << metrics.enabled;
        out << YAML::Key << "collection_interval" << YAML::Value << metrics.collection_interval;
        out << YAML::Key << "max_points" << YAML::Value << metrics.max_points;
        out << YAML::Key << "output_file" << YAML::Value << metrics.output_file;
        out << YAML::Key << "format" << YAML::Value << metrics.format;
        out << YAML::EndMap;

        // Logging
        const auto& logging = config_.logging;
        out << YAML::Key << "logging";
        out << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << logging.level;
        out << YAML::Key << "pattern" << YAML::Value << logging.pattern;
        out << YAML::Key << "async" << YAML::Value << logging.async;
        out << YAML::Key << "log_file" << YAML::Value << logging.log_file;
        out << YAML::Key << "max_file_size" << YAML::Value << logging.max_file_size;
        out << YAML::Key << "max_files" << YAML::Value << logging.max_files;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(filename);
        if (!file.is_open()) {
            spdlog::error("ConfigurationManager: Failed to open {} for writing", filename);
            return false;
        }
        file << out.c_str();

        spdlog::info("ConfigurationManager: Saved configuration to {}", filename);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("ConfigurationManager: Failed to save {}: {}", filename, e.what());
        return false;
    }
}

SystemConfig ConfigurationManager::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void ConfigurationManager::set_config(const SystemConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }
    notify_change(config);
}

std::vector<std::string> ConfigurationManager::validate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validate_config(config_);
}

std::vector<std::string> ConfigurationManager::validate_config(const SystemConfig& config) {
    std::vector<std::string> errors;

    // Rate limits
    for (const auto& [key, limit] : config.rate_limits) {
        if (limit.max_tokens <= 0.0) {
            errors.push_back("rate_limits." + key + ".max_tokens must be > 0");
        }
        if (limit.interval_seconds <= 0.0) {
            errors.push_back("rate_limits." + key + ".interval must be > 0");
        }
    }

    // Circuit breaker
    if (config.circuit_breaker.error_threshold < 1) {
        errors.push_back("circuit_breaker.error_threshold must be >= 1");
    }
    if (config.circuit_breaker.error_timeout.count() < 0.0) {
        errors.push_back("circuit_breaker.error_timeout must be >= 0");
    }
    if (config.circuit_breaker.circuit_timeout.count() < 0.0) {
        errors.push_back("circuit_breaker.circuit_timeout must be >= 0");
    }

    // Failover
    if (config.failover.check_interval.count() <= 0.0) {
        errors.push_back("failover.check_interval must be > 0");
    }
    if (config.failover.recovery_backoff.count() < 0.0) {
        errors.push_back("failover.recovery_backoff must be >= 0");
    }

    // API
    if (config.api.max_retries < 1) {
        errors.push_back("api.max_retries must be >= 1");
    }
    if (config.api.retry_delay.count() < 0.0) {
        errors.push_back("api.retry_delay must be >= 0");
    }
    for (const auto& [method, key] : config.api.method_limits) {
        if (config.rate_limits.find(key) == config.rate_limits.end()) {
            errors.push_back("api.method_limits." + method + " refers to unknown rate limit '" + key + "'");
        }
    }

    // Metrics
    if (config.metrics.collection_interval <= 0.0) {
        errors.push_back("metrics.collection_interval must be > 0");
    }
    if (config.metrics.max_points == 0) {
        errors.push_back("metrics.max_points must be > 0");
    }
    if (!parse_recording_format(config.metrics.format)) {
        errors.push_back("metrics.format must be csv or json");
    }

    // Logging
    if (!is_valid_log_level(config.logging.level)) {
        errors.push_back("logging.level '" + config.logging.level + "' is not a valid level");
    }

    return errors;
}

void ConfigurationManager::set_change_callback(ConfigChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    change_callback_ = std::move(callback);
}

bool ConfigurationManager::reload() {
    std::string filename = get_filename();
    if (filename.empty()) {
        spdlog::warn("ConfigurationManager: No filename set, cannot reload");
        return false;
    }

    return load(filename);
}

std::string ConfigurationManager::get_filename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filename_;
}

SystemConfig ConfigurationManager::create_default() {
    SystemConfig config;

    config.api.method_limits = {
        {"place_order", "order"},
        {"cancel_order", "order"},
        {"get_open_orders", "order"},
        {"get_positions", "position"},
        {"set_leverage", "position"},
        {"get_klines", "market"},
        {"get_ticker", "market"},
        {"get_server_time", "market"},
        {"get_wallet_balance", "account"}
    };

    return config;
}

bool ConfigurationManager::create_example(const std::string& filename) {
    ConfigurationManager manager;
    return manager.save(filename);
}

bool ConfigurationManager::parse_yaml(const std::string& yaml_content, SystemConfig& config) {
    try {
        YAML::Node root = YAML::Load(yaml_content);

        // Parse rate limits (replaces the whole table)
        if (root["rate_limits"]) {
            RateLimitTable limits;
            for (const auto& entry : root["rate_limits"]) {
                auto key = entry.first.as<std::string>();
                auto node = entry.second;

                RateLimit limit;
                limit.max_tokens = node["max_tokens"].as<double>(limit.max_tokens);
                limit.interval_seconds = node["interval"].as<double>(limit.interval_seconds);
                limits[key] = limit;
            }
            config.rate_limits = limits;
        }

        // Parse circuit breaker
        if (root["circuit_breaker"]) {
            auto node = root["circuit_breaker"];
            auto& cb = config.circuit_breaker;
            cb.error_threshold = node["error_threshold"].as<uint32_t>(cb.error_threshold);
            cb.error_timeout = Seconds(node["error_timeout"].as<double>(cb.error_timeout.count()));
            cb.circuit_timeout = Seconds(node["circuit_timeout"].as<double>(cb.circuit_timeout.count()));
            cb.single_probe = node["single_probe"].as<bool>(cb.single_probe);
        }

        // Parse failover
        if (root["failover"]) {
            auto node = root["failover"];
            auto& fo = config.failover;
            fo.enabled = node["enabled"].as<bool>(fo.enabled);
            fo.auto_recovery = node["auto_recovery"].as<bool>(fo.auto_recovery);
            fo.max_recovery_attempts = node["max_recovery_attempts"].as<uint32_t>(fo.max_recovery_attempts);
            fo.recovery_backoff = Seconds(node["recovery_backoff"].as<double>(fo.recovery_backoff.count()));
            fo.emergency_shutdown = node["emergency_shutdown"].as<bool>(fo.emergency_shutdown);
            fo.notification_enabled = node["notification_enabled"].as<bool>(fo.notification_enabled);
            fo.check_interval = Seconds(node["check_interval"].as<double>(fo.check_interval.count()));
        }

        // Parse API guard
        if (root["api"]) {
            auto node = root["api"];
            auto& api = config.api;
            api.max_retries = node["max_retries"].as<uint32_t>(api.max_retries);
            api.retry_delay = Seconds(node["retry_delay"].as<double>(api.retry_delay.count()));
            api.block_on_limit = node["block_on_limit"].as<bool>(api.block_on_limit);
            if (node["limit_timeout"]) {
                api.limit_timeout = Seconds(node["limit_timeout"].as<double>());
            }
            if (node["method_limits"]) {
                api.method_limits = node["method_limits"].as<std::map<std::string, std::string>>();
            }
        }

        // Parse metrics
        if (root["metrics"]) {
            auto node = root["metrics"];
            auto& metrics = config.metrics;
            metrics.enabled = node["enabled"].as<bool>(metrics.enabled);
            metrics.collection_interval = node["collection_interval"].as<double>(metrics.collection_interval);
            metrics.max_points = node["max_points"].as<size_t>(metrics.max_points);
            metrics.output_file = substitute_env_vars(node["output_file"].as<std::string>(metrics.output_file));
            metrics.format = node["format"].as<std::string>(metrics.format);
        }

        // Parse logging
        if (root["logging"]) {
            auto node = root["logging"];
            auto& logging = config.logging;
            logging.level = node["level"].as<std::string>(logging.level);
            logging.pattern = node["pattern"].as<std::string>(logging.pattern);
            logging.async = node["async"].as<bool>(logging.async);
            logging.log_file = substitute_env_vars(node["log_file"].as<std::string>(logging.log_file));
            logging.max_file_size = node["max_file_size"].as<size_t>(logging.max_file_size);
            logging.max_files = node["max_files"].as<size_t>(logging.max_files);
        }

        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("ConfigurationManager: YAML parse error: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("ConfigurationManager: Parse error: {}", e.what());
        return false;
    }
}

std::string ConfigurationManager::substitute_env_vars(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find("${", pos)) != std::string::npos) {
        size_t end = result.find('}', pos);
        if (end == std::string::npos) {
            break;
        }

        std::string var_name = result.substr(pos + 2, end - pos - 2);
        const char* env_value = std::getenv(var_name.c_str());

        if (env_value) {
            result.replace(pos, end - pos + 1, env_value);
            pos += std::strlen(env_value);
        } else {
            pos = end + 1;
        }
    }

    return result;
}

void ConfigurationManager::notify_change(const SystemConfig& config) {
    ConfigChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = change_callback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(config);
    } catch (const std::exception& e) {
        spdlog::error("ConfigurationManager: Change callback failed: {}", e.what());
    }
}

} // namespace tradeguard
