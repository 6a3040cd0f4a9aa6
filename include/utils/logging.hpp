/**
 * @file logging.hpp
 * @brief spdlog setup for the resilience layer
 *
 * Every component logs through the spdlog default logger with a
 * "ClassName: message" prefix. configure_logging() replaces that default
 * logger once at startup.
 *
 * **Sinks:**
 * - Colour console (always)
 * - Rotating file (when log_file is set)
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include <cstddef>
#include <string>

namespace tradeguard {

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level{"info"};                                 ///< trace|debug|info|warn|error|critical|off
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"}; ///< spdlog pattern
    bool async{true};                                          ///< Use spdlog's async logger
    std::string log_file;                                      ///< Rotating file path (empty = console only)
    size_t max_file_size{10485760};                            ///< Bytes per file (10MB)
    size_t max_files{5};                                       ///< Rotated files kept
};

/**
 * @brief Check a level name
 *
 * @return bool True for the names listed on LoggingConfig::level
 */
bool is_valid_log_level(const std::string& level);

/**
 * @brief Install the default logger described by @p config
 *
 * An unknown level falls back to info with a warning. A log file that
 * cannot be opened is reported and logging continues on the console.
 *
 * @code
 * LoggingConfig logging;
 * logging.level = "debug";
 * logging.log_file = "logs/tradeguard.log";
 * configure_logging(logging);
 *
 * spdlog::info("RateLimiter: Initialized");
 * @endcode
 *
 * @note Call before starting any component thread
 */
void configure_logging(const LoggingConfig& config);

} // namespace tradeguard
