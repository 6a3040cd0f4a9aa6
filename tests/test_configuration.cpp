/**
 * @file test_configuration.cpp
 * @brief Unit tests for configuration management and logging setup
 */

#include <gtest/gtest.h>
#include "config/configuration_manager.hpp"
#include "utils/logging.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace tradeguard;

namespace {

bool contains_error(const std::vector<std::string>& errors, const std::string& fragment) {
    return std::any_of(errors.begin(), errors.end(), [&fragment](const std::string& error) {
        return error.find(fragment) != std::string::npos;
    });
}

} // namespace

// ============================================================================
// Configuration Manager Tests
// ============================================================================

class ConfigurationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temporary config file
        test_config_path = std::filesystem::temp_directory_path() / "tradeguard_test_config.yaml";
        create_test_config();
    }

    void TearDown() override {
        // Clean up
        if (std::filesystem::exists(test_config_path)) {
            std::filesystem::remove(test_config_path);
        }
    }

    void create_test_config() {
        std::ofstream file(test_config_path);
        file << R"(
rate_limits:
  default: {max_tokens: 200, interval: 10}
  order: {max_tokens: 20, interval: 5}
  market: {max_tokens: 60, interval: 1}

circuit_breaker:
  error_threshold: 4
  error_timeout: 30
  circuit_timeout: 120
  single_probe: false

failover:
  enabled: true
  auto_recovery: false
  max_recovery_attempts: 5
  recovery_backoff: 15.5
  emergency_shutdown: false
  notification_enabled: true
  check_interval: 10

api:
  max_retries: 4
  retry_delay: 0.5
  block_on_limit: false
  limit_timeout: 2
  method_limits:
    place_order: order
    get_ticker: market

metrics:
  enabled: true
  collection_interval: 5
  max_points: 500
  output_file: "metrics.csv"
  format: json

logging:
  level: "debug"
  async: false
  log_file: "logs/tradeguard.log"
  max_files: 3
)";
        file.close();
    }

    std::filesystem::path test_config_path;
};

TEST_F(ConfigurationManagerTest, DefaultConfiguration) {
    ConfigurationManager config;
    auto cfg = config.get_config();

    EXPECT_EQ(cfg.rate_limits.size(), 5u);
    EXPECT_DOUBLE_EQ(cfg.rate_limits.at("order").max_tokens, 50.0);

    EXPECT_EQ(cfg.circuit_breaker.error_threshold, 5u);
    EXPECT_DOUBLE_EQ(cfg.circuit_breaker.error_timeout.count(), 60.0);
    EXPECT_DOUBLE_EQ(cfg.circuit_breaker.circuit_timeout.count(), 300.0);

    EXPECT_TRUE(cfg.failover.enabled);
    EXPECT_TRUE(cfg.failover.auto_recovery);
    EXPECT_EQ(cfg.failover.max_recovery_attempts, 3u);
    EXPECT_DOUBLE_EQ(cfg.failover.recovery_backoff.count(), 60.0);
    EXPECT_DOUBLE_EQ(cfg.failover.check_interval.count(), 30.0);

    EXPECT_EQ(cfg.api.max_retries, 3u);
    EXPECT_DOUBLE_EQ(cfg.api.retry_delay.count(), 5.0);
    EXPECT_EQ(cfg.api.method_limits.at("place_order"), "order");
    EXPECT_EQ(cfg.api.method_limits.at("get_positions"), "position");
    EXPECT_EQ(cfg.api.method_limits.at("get_klines"), "market");
    EXPECT_EQ(cfg.api.method_limits.at("get_wallet_balance"), "account");

    EXPECT_DOUBLE_EQ(cfg.metrics.collection_interval, 10.0);
    EXPECT_EQ(cfg.logging.level, "info");

    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigurationManagerTest, LoadConfiguration) {
    ConfigurationManager config;
    ASSERT_TRUE(config.load(test_config_path.string()));

    auto cfg = config.get_config();

    // Rate limits replace the whole table
    ASSERT_EQ(cfg.rate_limits.size(), 3u);
    EXPECT_DOUBLE_EQ(cfg.rate_limits.at("default").max_tokens, 200.0);
    EXPECT_DOUBLE_EQ(cfg.rate_limits.at("order").max_tokens, 20.0);
    EXPECT_DOUBLE_EQ(cfg.rate_limits.at("order").interval_seconds, 5.0);
    EXPECT_EQ(cfg.rate_limits.count("position"), 0u);

    EXPECT_EQ(cfg.circuit_breaker.error_threshold, 4u);
    EXPECT_DOUBLE_EQ(cfg.circuit_breaker.error_timeout.count(), 30.0);
    EXPECT_DOUBLE_EQ(cfg.circuit_breaker.circuit_timeout.count(), 120.0);
    EXPECT_FALSE(cfg.circuit_breaker.single_probe);

    EXPECT_FALSE(cfg.failover.auto_recovery);
    EXPECT_EQ(cfg.failover.max_recovery_attempts, 5u);
    EXPECT_DOUBLE_EQ(cfg.failover.recovery_backoff.count(), 15.5);
    EXPECT_FALSE(cfg.failover.emergency_shutdown);
    EXPECT_DOUBLE_EQ(cfg.failover.check_interval.count(), 10.0);

    EXPECT_EQ(cfg.api.max_retries, 4u);
    EXPECT_DOUBLE_EQ(cfg.api.retry_delay.count(), 0.5);
    EXPECT_FALSE(cfg.api.block_on_limit);
    ASSERT_TRUE(cfg.api.limit_timeout.has_value());
    EXPECT_DOUBLE_EQ(cfg.api.limit_timeout->count(), 2.0);
    ASSERT_EQ(cfg.api.method_limits.size(), 2u);
    EXPECT_EQ(cfg.api.method_limits.at("get_ticker"), "market");

    EXPECT_DOUBLE_EQ(cfg.metrics.collection_interval, 5.0);
    EXPECT_EQ(cfg.metrics.max_points, 500u);
    EXPECT_EQ(cfg.metrics.output_file, "metrics.csv");
    EXPECT_EQ(cfg.metrics.format, "json");

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_FALSE(cfg.logging.async);
    EXPECT_EQ(cfg.logging.log_file, "logs/tradeguard.log");
    EXPECT_EQ(cfg.logging.max_files, 3u);

    EXPECT_EQ(config.get_filename(), test_config_path.string());
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigurationManagerTest, MissingKeysKeepDefaults) {
    ConfigurationManager config;
    ASSERT_TRUE(config.load_from_string("circuit_breaker:\n  error_threshold: 7\n"));

    auto cfg = config.get_config();
    EXPECT_EQ(cfg.circuit_breaker.error_threshold, 7u);
    EXPECT_DOUBLE_EQ(cfg.circuit_breaker.circuit_timeout.count(), 300.0);
    EXPECT_EQ(cfg.rate_limits.size(), 5u);
    EXPECT_EQ(cfg.failover.max_recovery_attempts, 3u);
}

TEST_F(ConfigurationManagerTest, LoadNonexistentFile) {
    ConfigurationManager config;
    EXPECT_FALSE(config.load("/nonexistent/tradeguard.yaml"));
    EXPECT_TRUE(config.get_filename().empty());
}

TEST_F(ConfigurationManagerTest, MalformedYamlKeepsCurrent) {
    ConfigurationManager config;
    ASSERT_TRUE(config.load_from_string("failover:\n  max_recovery_attempts: 9\n"));

    EXPECT_FALSE(config.load_from_string("failover: [unterminated"));

    EXPECT_EQ(config.get_config().failover.max_recovery_attempts, 9u);
}

TEST_F(ConfigurationManagerTest, Validation) {
    ConfigurationManager config;

    auto cfg = config.get_config();
    cfg.rate_limits["order"].max_tokens = 0.0;
    cfg.circuit_breaker.error_threshold = 0;
    cfg.failover.check_interval = Seconds(0.0);
    cfg.api.max_retries = 0;
    cfg.api.method_limits["get_funding"] = "funding";
    cfg.metrics.format = "parquet";
    cfg.logging.level = "verbose";
    config.set_config(cfg);

    auto errors = config.validate();
    EXPECT_EQ(errors.size(), 7u);
    EXPECT_TRUE(contains_error(errors, "rate_limits.order.max_tokens"));
    EXPECT_TRUE(contains_error(errors, "circuit_breaker.error_threshold"));
    EXPECT_TRUE(contains_error(errors, "failover.check_interval"));
    EXPECT_TRUE(contains_error(errors, "api.max_retries"));
    EXPECT_TRUE(contains_error(errors, "unknown rate limit 'funding'"));
    EXPECT_TRUE(contains_error(errors, "metrics.format"));
    EXPECT_TRUE(contains_error(errors, "logging.level"));
}

TEST_F(ConfigurationManagerTest, EnvironmentSubstitution) {
    setenv("TRADEGUARD_TEST_DIR", "/var/lib/tradeguard", 1);

    ConfigurationManager config;
    ASSERT_TRUE(config.load_from_string(
        "metrics:\n  output_file: \"${TRADEGUARD_TEST_DIR}/metrics.csv\"\n"
        "logging:\n  log_file: \"${TRADEGUARD_UNSET_VAR}/app.log\"\n"));

    auto cfg = config.get_config();
    EXPECT_EQ(cfg.metrics.output_file, "/var/lib/tradeguard/metrics.csv");

    // Unknown variables are left as written
    EXPECT_EQ(cfg.logging.log_file, "${TRADEGUARD_UNSET_VAR}/app.log");

    unsetenv("TRADEGUARD_TEST_DIR");
}

TEST_F(ConfigurationManagerTest, ChangeCallback) {
    ConfigurationManager config;

    int calls = 0;
    uint32_t seen_threshold = 0;
    config.set_change_callback([&](const SystemConfig& cfg) {
        calls++;
        seen_threshold = cfg.circuit_breaker.error_threshold;
    });

    ASSERT_TRUE(config.load(test_config_path.string()));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen_threshold, 4u);

    // Strings are not a file change
    ASSERT_TRUE(config.load_from_string("circuit_breaker: {error_threshold: 9}"));
    EXPECT_EQ(calls, 1);

    auto cfg = config.get_config();
    cfg.circuit_breaker.error_threshold = 2;
    config.set_config(cfg);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(seen_threshold, 2u);
}

TEST_F(ConfigurationManagerTest, Reload) {
    ConfigurationManager config;
    EXPECT_FALSE(config.reload());

    ASSERT_TRUE(config.load(test_config_path.string()));

    {
        std::ofstream file(test_config_path);
        file << "failover:\n  max_recovery_attempts: 8\n";
    }

    ASSERT_TRUE(config.reload());
    EXPECT_EQ(config.get_config().failover.max_recovery_attempts, 8u);
}

TEST_F(ConfigurationManagerTest, SaveAndLoadBack) {
    auto saved_path = std::filesystem::temp_directory_path() / "tradeguard_saved_config.yaml";

    ConfigurationManager original;
    ASSERT_TRUE(original.load(test_config_path.string()));
    ASSERT_TRUE(original.save(saved_path.string()));

    ConfigurationManager loaded;
    ASSERT_TRUE(loaded.load(saved_path.string()));

    auto a = original.get_config();
    auto b = loaded.get_config();

    EXPECT_EQ(b.rate_limits.size(), a.rate_limits.size());
    EXPECT_DOUBLE_EQ(b.rate_limits.at("order").interval_seconds, 5.0);
    EXPECT_EQ(b.circuit_breaker.error_threshold, a.circuit_breaker.error_threshold);
    EXPECT_DOUBLE_EQ(b.failover.recovery_backoff.count(), 15.5);
    EXPECT_EQ(b.api.method_limits, a.api.method_limits);
    ASSERT_TRUE(b.api.limit_timeout.has_value());
    EXPECT_EQ(b.metrics.format, "json");
    EXPECT_EQ(b.logging.level, "debug");

    std::filesystem::remove(saved_path);
}

TEST_F(ConfigurationManagerTest, CreateExample) {
    auto example_path = std::filesystem::temp_directory_path() / "tradeguard_example.yaml";

    ASSERT_TRUE(ConfigurationManager::create_example(example_path.string()));

    ConfigurationManager config;
    ASSERT_TRUE(config.load(example_path.string()));
    EXPECT_TRUE(config.validate().empty());
    EXPECT_EQ(config.get_config().api.method_limits.size(), 9u);

    std::filesystem::remove(example_path);
}

// ============================================================================
// Logging Tests
// ============================================================================

TEST(LoggingTest, LevelNames) {
    EXPECT_TRUE(is_valid_log_level("trace"));
    EXPECT_TRUE(is_valid_log_level("info"));
    EXPECT_TRUE(is_valid_log_level("off"));
    EXPECT_FALSE(is_valid_log_level("verbose"));
    EXPECT_FALSE(is_valid_log_level("INFO"));
}

TEST(LoggingTest, ConfigureSynchronous) {
    LoggingConfig logging;
    logging.level = "warn";
    logging.async = false;

    EXPECT_NO_THROW(configure_logging(logging));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

    logging.level = "nonsense";
    EXPECT_NO_THROW(configure_logging(logging));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}
