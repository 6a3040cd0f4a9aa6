/**
 * @file circuit_breaker.cpp
 * @brief Circuit breaker implementation
 */

#include "resilience/circuit_breaker.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace tradeguard {

void validate_circuit_breaker_config(const CircuitBreakerConfig& config) {
    if (config.error_threshold == 0) {
        throw std::invalid_argument("CircuitBreaker: error_threshold must be >= 1");
    }

    if (config.error_timeout.count() < 0.0 || config.circuit_timeout.count() < 0.0) {
        throw std::invalid_argument("CircuitBreaker: timeouts must be >= 0");
    }
}

CircuitBreaker::CircuitBreaker(std::string name, const CircuitBreakerConfig& config)
    : name_(std::move(name))
    , config_(config) {
    validate_circuit_breaker_config(config_);
}

bool CircuitBreaker::allow_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = SteadyClock::now();

    switch (state_) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN:
            if (now - open_time_ > config_.circuit_timeout) {
                spdlog::info("CircuitBreaker: '{}' timeout elapsed, moving to half-open", name_);
                state_ = CircuitState::HALF_OPEN;
                probe_in_flight_ = true;
                probe_start_time_ = now;
                return true;
            }
            return false;

        case CircuitState::HALF_OPEN:
            if (!config_.single_probe) {
                return true;
            }
            if (probe_in_flight_ && now - probe_start_time_ <= config_.circuit_timeout) {
                return false;
            }
            // Previous probe never reported back
            probe_in_flight_ = true;
            probe_start_time_ = now;
            return true;
    }

    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == CircuitState::HALF_OPEN) {
        close_circuit();
    }
}

void CircuitBreaker::record_error() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = SteadyClock::now();

    if (state_ == CircuitState::OPEN) {
        spdlog::debug("CircuitBreaker: '{}' is open, error ignored", name_);
        return;
    }

    if (state_ == CircuitState::HALF_OPEN) {
        open_circuit(now);
        return;
    }

    if (!last_error_time_ || now - *last_error_time_ > config_.error_timeout) {
        if (error_count_ > 0) {
            spdlog::debug("CircuitBreaker: '{}' error timeout elapsed, resetting count from {}",
                         name_, error_count_);
        }
        error_count_ = 0;
    }

    error_count_++;
    last_error_time_ = now;

    spdlog::debug("CircuitBreaker: '{}' error count {}/{}",
                 name_, error_count_, config_.error_threshold);

    if (error_count_ >= config_.error_threshold) {
        open_circuit(now);
    }
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);

    state_ = CircuitState::CLOSED;
    error_count_ = 0;
    last_error_time_.reset();
    open_time_ = SteadyClock::time_point{};
    probe_in_flight_ = false;

    spdlog::info("CircuitBreaker: '{}' manually reset to closed", name_);
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::get_error_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_count_;
}

CircuitBreakerSnapshot CircuitBreaker::get_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CircuitBreakerSnapshot snapshot;
    snapshot.name = name_;
    snapshot.state = state_;
    snapshot.error_count = error_count_;
    if (state_ != CircuitState::CLOSED) {
        snapshot.seconds_since_open = Seconds(SteadyClock::now() - open_time_).count();
    }
    return snapshot;
}

void CircuitBreaker::open_circuit(SteadyClock::time_point now) {
    state_ = CircuitState::OPEN;
    open_time_ = now;
    error_count_ = 0;
    probe_in_flight_ = false;

    spdlog::warn("CircuitBreaker: '{}' opened due to excessive errors", name_);
}

void CircuitBreaker::close_circuit() {
    state_ = CircuitState::CLOSED;
    error_count_ = 0;
    probe_in_flight_ = false;

    spdlog::info("CircuitBreaker: '{}' closed, resuming normal operation", name_);
}

} // namespace tradeguard
