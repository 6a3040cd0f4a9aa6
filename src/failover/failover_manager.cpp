/**
 * @file failover_manager.cpp
 * @brief Failover manager implementation
 */

#include "failover/failover_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tradeguard {

namespace {

bool is_unhealthy_critical(ComponentStatus status) {
    return status == ComponentStatus::CRITICAL || status == ComponentStatus::FAILED;
}

} // namespace

const std::vector<std::string>& FailoverManager::component_names() {
    static const std::vector<std::string> names = {
        component::API_CLIENT,
        component::DATA_STREAM,
        component::PERSISTENCE,
        component::STRATEGY_ENGINE,
        component::ORDER_ENGINE
    };
    return names;
}

bool FailoverManager::is_critical(const std::string& name) {
    return name == component::API_CLIENT ||
           name == component::STRATEGY_ENGINE ||
           name == component::ORDER_ENGINE;
}

FailoverManager::FailoverManager(const FailoverConfig& config)
    : config_(config) {
    validate_config(config_);

    for (const auto& name : component_names()) {
        ComponentRecord record;
        record.critical = is_critical(name);
        components_.emplace(name, std::move(record));
    }

    spdlog::info("FailoverManager: Initialized with {} components (check interval {}s)",
                components_.size(), config_.check_interval.count());
}

FailoverManager::~FailoverManager() {
    stop();
}

void FailoverManager::validate_config(const FailoverConfig& config) {
    if (config.check_interval.count() <= 0.0) {
        throw std::invalid_argument("FailoverManager: check_interval must be > 0");
    }

    if (config.recovery_backoff.count() < 0.0) {
        throw std::invalid_argument("FailoverManager: recovery_backoff must be >= 0");
    }
}

// ============================================================================
// Collaborators
// ============================================================================

void FailoverManager::set_health_check(const std::string& name, HealthCheckFn check) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(name);
    if (it == components_.end()) {
        throw std::invalid_argument("FailoverManager: unknown component '" + name + "'");
    }
    it->second.check = std::move(check);
}

void FailoverManager::set_recovery_function(const std::string& name, RecoveryFn recovery) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(name);
    if (it == components_.end()) {
        throw std::invalid_argument("FailoverManager: unknown component '" + name + "'");
    }
    it->second.recover = std::move(recovery);
}

void FailoverManager::set_notifier(NotifyFn notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

void FailoverManager::set_shutdown_handler(ShutdownFn shutdown) {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_handler_ = std::move(shutdown);
}

// ============================================================================
// Lifecycle
// ============================================================================

bool FailoverManager::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enabled) {
            spdlog::info("FailoverManager: Disabled by configuration, not starting");
            return false;
        }
    }

    if (running_) {
        spdlog::warn("FailoverManager: Already running");
        return false;
    }

    // Loop thread left behind by a stop() issued from inside the loop
    if (loop_thread_) {
        if (loop_thread_->get_id() == std::this_thread::get_id()) {
            spdlog::warn("FailoverManager: Cannot restart from the supervision thread");
            return false;
        }
        if (loop_thread_->joinable()) {
            loop_thread_->join();
        }
        loop_thread_.reset();
    }

    if (running_.exchange(true)) {
        spdlog::warn("FailoverManager: Already running");
        return false;
    }

    loop_thread_ = std::make_unique<std::thread>(&FailoverManager::supervision_loop, this);

    spdlog::info("FailoverManager: Started supervision loop");
    return true;
}

void FailoverManager::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_ = false;
    }
    wake_cv_.notify_all();

    if (!loop_thread_ || !loop_thread_->joinable()) {
        return;
    }

    // A shutdown handler may call stop() from the loop thread itself
    if (loop_thread_->get_id() == std::this_thread::get_id()) {
        return;
    }

    loop_thread_->join();
    loop_thread_.reset();

    spdlog::info("FailoverManager: Stopped");
}

void FailoverManager::supervision_loop() {
    while (running_) {
        try {
            run_once();
        } catch (const std::exception& e) {
            spdlog::error("FailoverManager: Supervision cycle failed: {}", e.what());
        } catch (...) {
            spdlog::error("FailoverManager: Supervision cycle failed: unknown exception");
        }

        auto interval = get_config().check_interval;

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock,
                          std::chrono::duration_cast<std::chrono::milliseconds>(interval),
                          [this]() { return !running_.load(); });
    }
}

void FailoverManager::run_once() {
    std::lock_guard<std::mutex> cycle(cycle_mutex_);

    check_components();
    update_state();
    handle_failover();
}

// ============================================================================
// Check / Update / Handle
// ============================================================================

ComponentStatus FailoverManager::run_health_check(const std::string& name,
                                                  const HealthCheckFn& check) {
    try {
        return check();
    } catch (const std::exception& e) {
        spdlog::error("FailoverManager: Health check for '{}' threw: {}", name, e.what());
        return ComponentStatus::FAILED;
    } catch (...) {
        spdlog::error("FailoverManager: Health check for '{}' threw unknown exception", name);
        return ComponentStatus::FAILED;
    }
}

void FailoverManager::check_components() {
    // Copy checks so they run without the lock
    std::vector<std::pair<std::string, HealthCheckFn>> checks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& name : component_names()) {
            const auto& record = components_.at(name);
            if (record.check) {
                checks.emplace_back(name, record.check);
            }
        }
    }

    for (const auto& [name, check] : checks) {
        auto status = run_health_check(name, check);
        auto now = SystemClock::now();

        std::lock_guard<std::mutex> lock(mutex_);
        auto& record = components_.at(name);

        if (record.status != status) {
            spdlog::debug("FailoverManager: '{}' {} -> {}", name,
                         component_status_to_string(record.status),
                         component_status_to_string(status));
        }

        record.status = status;
        record.last_check = now;

        if (status == ComponentStatus::HEALTHY) {
            record.failure_count = 0;
            record.last_failure.reset();
        } else {
            record.failure_count++;
            if (!record.last_failure) {
                record.last_failure = now;
            }
        }
    }
}

FailoverState FailoverManager::update_state() {
    FailoverState previous;
    FailoverState next;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        bool critical_failed = false;
        bool recovering = false;
        bool warning = false;

        for (const auto& [name, record] : components_) {
            if (record.critical && is_unhealthy_critical(record.status)) {
                critical_failed = true;
            }
            if (record.status == ComponentStatus::RECOVERING) {
                recovering = true;
            }
            if (record.status == ComponentStatus::WARNING) {
                warning = true;
            }
        }

        if (critical_failed) {
            next = FailoverState::EMERGENCY;
        } else if (recovering) {
            next = FailoverState::RECOVERY;
        } else if (warning) {
            next = FailoverState::DEGRADED;
        } else {
            next = FailoverState::NORMAL;
        }

        previous = state_;
        state_ = next;

        if (next != FailoverState::EMERGENCY) {
            shutdown_triggered_ = false;
        }
    }

    if (previous != next) {
        if (next == FailoverState::NORMAL) {
            spdlog::info("FailoverManager: State changed {} -> {}",
                        failover_state_to_string(previous), failover_state_to_string(next));
        } else {
            spdlog::warn("FailoverManager: State changed {} -> {}",
                        failover_state_to_string(previous), failover_state_to_string(next));
        }

        notify(std::string("System state changed: ") + failover_state_to_string(previous) +
               " -> " + failover_state_to_string(next));
    }

    return next;
}

void FailoverManager::handle_failover() {
    switch (get_state()) {
        case FailoverState::NORMAL:
            break;
        case FailoverState::DEGRADED:
            handle_degraded();
            break;
        case FailoverState::FAILOVER:
            handle_failover_state();
            break;
        case FailoverState::RECOVERY:
            handle_recovery();
            break;
        case FailoverState::EMERGENCY:
            handle_emergency();
            break;
    }
}

std::vector<std::string> FailoverManager::select_components(
    const std::function<bool(const ComponentRecord&)>& predicate) const {

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> selected;
    for (const auto& name : component_names()) {
        if (predicate(components_.at(name))) {
            selected.push_back(name);
        }
    }
    return selected;
}

void FailoverManager::handle_degraded() {
    auto degraded = select_components([](const ComponentRecord& r) {
        return r.status == ComponentStatus::WARNING;
    });

    for (const auto& name : degraded) {
        spdlog::info("FailoverManager: Attempting recovery of degraded component '{}'", name);
        attempt_recovery(name);
    }
}

void FailoverManager::handle_failover_state() {
    auto failed = select_components([](const ComponentRecord& r) {
        return r.critical && is_unhealthy_critical(r.status);
    });

    for (const auto& name : failed) {
        spdlog::warn("FailoverManager: '{}' failed, using backup system", name);
    }
}

void FailoverManager::handle_recovery() {
    auto recovering = select_components([](const ComponentRecord& r) {
        return r.status == ComponentStatus::RECOVERING;
    });

    for (const auto& name : recovering) {
        continue_recovery(name);
    }
}

void FailoverManager::continue_recovery(const std::string& name) {
    HealthCheckFn check;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        check = components_.at(name).check;
    }

    auto status = check ? run_health_check(name, check) : ComponentStatus::RECOVERING;

    if (status == ComponentStatus::HEALTHY) {
        std::lock_guard<std::mutex> lock(mutex_);
        mark_healthy(components_.at(name));
        spdlog::info("FailoverManager: '{}' recovered", name);
        return;
    }

    attempt_recovery(name);
}

void FailoverManager::handle_emergency() {
    spdlog::critical("FailoverManager: EMERGENCY state, critical component failure");

    auto failed = select_components([](const ComponentRecord& r) {
        return r.critical && is_unhealthy_critical(r.status);
    });

    if (failed.empty()) {
        return;
    }

    for (const auto& name : failed) {
        attempt_recovery(name);
    }

    ShutdownFn shutdown;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        bool all_exhausted = std::all_of(failed.begin(), failed.end(),
            [this](const std::string& name) {
                const auto& record = components_.at(name);
                return is_unhealthy_critical(record.status) &&
                       record.recovery_attempts >= config_.max_recovery_attempts;
            });

        if (!all_exhausted || !config_.emergency_shutdown || shutdown_triggered_) {
            return;
        }

        shutdown_triggered_ = true;
        shutdown = shutdown_handler_;
    }

    spdlog::critical("FailoverManager: Recovery exhausted for all failed critical components, "
                    "triggering emergency shutdown");
    notify("EMERGENCY SHUTDOWN: recovery attempts exhausted for critical components");

    if (!shutdown) {
        spdlog::error("FailoverManager: No shutdown handler registered");
        return;
    }

    try {
        shutdown();
    } catch (const std::exception& e) {
        spdlog::error("FailoverManager: Shutdown handler threw: {}", e.what());
    } catch (...) {
        spdlog::error("FailoverManager: Shutdown handler threw unknown exception");
    }
}

// ============================================================================
// Recovery
// ============================================================================

bool FailoverManager::attempt_recovery(const std::string& name) {
    RecoveryFn recover;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = components_.find(name);
        if (it == components_.end()) {
            spdlog::warn("FailoverManager: Recovery requested for unknown component '{}'", name);
            return false;
        }

        auto& record = it->second;

        if (!config_.auto_recovery) {
            return false;
        }

        if (!record.recover) {
            spdlog::debug("FailoverManager: No recovery function for '{}'", name);
            return false;
        }

        if (record.recovery_attempts >= config_.max_recovery_attempts) {
            spdlog::warn("FailoverManager: Max recovery attempts reached for '{}'", name);
            return false;
        }

        auto now = SteadyClock::now();
        if (record.last_recovery_time &&
            now - *record.last_recovery_time < config_.recovery_backoff) {
            spdlog::debug("FailoverManager: Recovery of '{}' in backoff", name);
            return false;
        }

        record.status = ComponentStatus::RECOVERING;
        record.recovery_attempts++;
        record.last_recovery_time = now;
        recover = record.recover;

        spdlog::info("FailoverManager: Attempting recovery of '{}' (attempt {}/{})",
                    name, record.recovery_attempts, config_.max_recovery_attempts);
    }

    bool success = false;
    try {
        success = recover();
    } catch (const std::exception& e) {
        spdlog::error("FailoverManager: Recovery of '{}' threw: {}", name, e.what());
        success = false;
    } catch (...) {
        spdlog::error("FailoverManager: Recovery of '{}' threw unknown exception", name);
        success = false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = components_.at(name);

    if (success) {
        mark_healthy(record);
        spdlog::info("FailoverManager: Successfully recovered '{}'", name);
    } else {
        record.status = ComponentStatus::FAILED;
        spdlog::error("FailoverManager: Failed to recover '{}'", name);
    }

    return success;
}

void FailoverManager::mark_healthy(ComponentRecord& record) {
    record.status = ComponentStatus::HEALTHY;
    record.failure_count = 0;
    record.last_failure.reset();
    record.recovery_attempts = 0;
}

bool FailoverManager::reset_component(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = components_.find(name);
    if (it == components_.end()) {
        spdlog::warn("FailoverManager: Cannot reset unknown component '{}'", name);
        return false;
    }

    mark_healthy(it->second);
    it->second.last_recovery_time.reset();

    spdlog::info("FailoverManager: Component '{}' reset", name);
    return true;
}

// ============================================================================
// Configuration / Status
// ============================================================================

bool FailoverManager::update_failover_config(const FailoverConfig& config) {
    try {
        validate_config(config);
    } catch (const std::invalid_argument& e) {
        spdlog::error("FailoverManager: Rejected configuration: {}", e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    spdlog::info("FailoverManager: Configuration updated (auto recovery {}, max attempts {}, "
                "backoff {}s)", config_.auto_recovery, config_.max_recovery_attempts,
                config_.recovery_backoff.count());
    return true;
}

FailoverConfig FailoverManager::get_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

FailoverState FailoverManager::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

FailoverStatus FailoverManager::get_failover_status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    FailoverStatus status;
    status.state = state_;
    status.config = config_;
    status.shutdown_triggered = shutdown_triggered_;
    status.running = running_.load();

    for (const auto& [name, record] : components_) {
        ComponentSnapshot snapshot;
        snapshot.name = name;
        snapshot.status = record.status;
        snapshot.critical = record.critical;
        snapshot.failure_count = record.failure_count;
        snapshot.last_check = record.last_check;
        snapshot.last_failure = record.last_failure;
        snapshot.recovery_attempts = record.recovery_attempts;
        snapshot.has_health_check = static_cast<bool>(record.check);
        snapshot.has_recovery_function = static_cast<bool>(record.recover);
        status.components.emplace(name, std::move(snapshot));
    }

    return status;
}

std::optional<ComponentSnapshot> FailoverManager::get_component_status(const std::string& name) const {
    auto status = get_failover_status();

    auto it = status.components.find(name);
    if (it == status.components.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FailoverManager::notify(const std::string& message) {
    NotifyFn notifier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.notification_enabled || !notifier_) {
            return;
        }
        notifier = notifier_;
    }

    try {
        notifier(message);
    } catch (const std::exception& e) {
        spdlog::warn("FailoverManager: Notification failed: {}", e.what());
    } catch (...) {
        spdlog::warn("FailoverManager: Notification failed: unknown exception");
    }
}

} // namespace tradeguard
