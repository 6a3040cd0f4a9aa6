/**
 * @file logging.cpp
 * @brief spdlog setup implementation
 */

#include "utils/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <memory>
#include <vector>

namespace tradeguard {

namespace {

constexpr size_t ASYNC_QUEUE_SIZE = 8192;
constexpr size_t ASYNC_THREADS = 1;
constexpr const char* LOGGER_NAME = "tradeguard";

} // namespace

bool is_valid_log_level(const std::string& level) {
    static const std::array<const char*, 7> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };

    for (const char* name : levels) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

void configure_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string file_error;
    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, config.max_file_size, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(ASYNC_QUEUE_SIZE, ASYNC_THREADS);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern(config.pattern);
    spdlog::flush_on(spdlog::level::warn);

    if (is_valid_log_level(config.level)) {
        spdlog::set_level(spdlog::level::from_str(config.level));
    } else {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Logging: Unknown level '{}', using info", config.level);
    }

    if (!file_error.empty()) {
        spdlog::error("Logging: Failed to open log file {}: {}", config.log_file, file_error);
    }

    spdlog::debug("Logging: Configured (level {}, async {}, file '{}')",
                 config.level, config.async, config.log_file);
}

} // namespace tradeguard
