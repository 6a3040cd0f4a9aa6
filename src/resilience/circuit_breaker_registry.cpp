/**
 * @file circuit_breaker_registry.cpp
 * @brief Circuit breaker registry implementation
 */

#include "resilience/circuit_breaker_registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace tradeguard {

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig& defaults)
    : defaults_(defaults) {
    validate_circuit_breaker_config(defaults_);

    spdlog::debug("CircuitBreakerRegistry: Created (threshold {}, error timeout {}s, circuit timeout {}s)",
                 defaults_.error_threshold, defaults_.error_timeout.count(),
                 defaults_.circuit_timeout.count());
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get_circuit_breaker(
    const std::string& name, const std::optional<CircuitBreakerConfig>& overrides) {

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }

    auto breaker = std::make_shared<CircuitBreaker>(name, overrides.value_or(defaults_));
    breakers_.emplace(name, breaker);

    spdlog::debug("CircuitBreakerRegistry: Created circuit breaker '{}'", name);
    return breaker;
}

std::map<std::string, CircuitState> CircuitBreakerRegistry::get_all_states() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, CircuitState> states;
    for (const auto& [name, breaker] : breakers_) {
        states.emplace(name, breaker->get_state());
    }

    return states;
}

size_t CircuitBreakerRegistry::count_in_state(CircuitState state) const {
    std::lock_guard<std::mutex> lock(mutex_);

    return static_cast<size_t>(std::count_if(breakers_.begin(), breakers_.end(),
        [state](const auto& pair) {
            return pair.second->get_state() == state;
        }));
}

void CircuitBreakerRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& [name, breaker] : breakers_) {
        breaker->reset();
    }

    spdlog::info("CircuitBreakerRegistry: Reset all circuit breakers ({})", breakers_.size());
}

size_t CircuitBreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace tradeguard
