/**
 * @file circuit_breaker_registry.hpp
 * @brief Lazily populated map of operation name to circuit breaker
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "resilience/circuit_breaker.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace tradeguard {

/**
 * @brief Registry of per-operation circuit breakers
 *
 * Breakers are created on first access with the registry-wide defaults
 * (or the overrides given on that first call) and live as long as the
 * registry. Later calls return the existing instance and ignore overrides.
 *
 * @code
 * CircuitBreakerRegistry registry(config.circuit_breaker);
 *
 * auto breaker = registry.get_circuit_breaker("place_order");
 * if (breaker->allow_request()) { ... }
 *
 * // Health polling
 * for (const auto& [name, state] : registry.get_all_states()) {
 *     std::cout << name << ": " << circuit_state_to_string(state) << "\n";
 * }
 * @endcode
 *
 * @note Thread-safe
 */
class CircuitBreakerRegistry {
public:
    /**
     * @brief Construct registry
     *
     * @param defaults Thresholds for breakers created without overrides
     *
     * @throws std::invalid_argument if the defaults are invalid
     */
    explicit CircuitBreakerRegistry(const CircuitBreakerConfig& defaults = CircuitBreakerConfig{});

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    /**
     * @brief Get or create the breaker for an operation
     *
     * @param name Operation name
     * @param overrides Thresholds used only if the breaker is created now
     * @return std::shared_ptr<CircuitBreaker> Breaker (never null)
     */
    std::shared_ptr<CircuitBreaker> get_circuit_breaker(
        const std::string& name,
        const std::optional<CircuitBreakerConfig>& overrides = std::nullopt);

    /**
     * @brief State of every breaker
     *
     * @return std::map<std::string, CircuitState> Name -> state
     */
    std::map<std::string, CircuitState> get_all_states() const;

    /**
     * @brief Count breakers currently in a state
     */
    size_t count_in_state(CircuitState state) const;

    /**
     * @brief Force every breaker CLOSED
     */
    void reset_all();

    size_t size() const;

    const CircuitBreakerConfig& default_config() const { return defaults_; }

private:
    const CircuitBreakerConfig defaults_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace tradeguard
