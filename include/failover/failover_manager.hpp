/**
 * @file failover_manager.hpp
 * @brief Health supervision, automatic recovery and emergency shutdown
 *
 * Supervises the five components of the trading client, derives a global
 * health state from their individual statuses and drives recovery or
 * escalation.
 *
 * **Supervision Cycle** (every check_interval):
 * 1. check_components(): run each component's health check
 * 2. update_state(): derive the global FailoverState
 * 3. handle_failover(): act on the global state
 *
 * **Global State Precedence:**
 * 1. Critical component CRITICAL or FAILED -> EMERGENCY
 * 2. Any component RECOVERING              -> RECOVERY
 * 3. Any component WARNING                 -> DEGRADED
 * 4. Otherwise                             -> NORMAL
 *
 * **Supervised Components:**
 * - api_client (critical)
 * - data_stream
 * - persistence
 * - strategy_engine (critical)
 * - order_engine (critical)
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "core/types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tradeguard {

/// Returns the current status of one component
using HealthCheckFn = std::function<ComponentStatus()>;

/// Tries to restore one component, returns true on success
using RecoveryFn = std::function<bool()>;

/// Delivers an operator notification (best effort)
using NotifyFn = std::function<void(const std::string&)>;

/// Shuts the trading client down
using ShutdownFn = std::function<void()>;

/**
 * @brief Failover manager configuration
 */
struct FailoverConfig {
    bool enabled{true};                  ///< Run the supervision loop
    bool auto_recovery{true};            ///< Invoke recovery functions
    uint32_t max_recovery_attempts{3};   ///< Attempts before giving up on a component
    Seconds recovery_backoff{60.0};      ///< Fixed minimum spacing between attempts
    bool emergency_shutdown{true};       ///< Shut down when critical recovery is exhausted
    bool notification_enabled{true};     ///< Send state change notifications
    Seconds check_interval{30.0};        ///< Supervision loop period
};

/**
 * @brief Point-in-time view of one supervised component
 */
struct ComponentSnapshot {
    std::string name;                                   ///< Component name
    ComponentStatus status{ComponentStatus::HEALTHY};   ///< Last known status
    bool critical{false};                               ///< Drives EMERGENCY
    uint32_t failure_count{0};                          ///< Consecutive unhealthy checks
    std::optional<SystemClock::time_point> last_check;  ///< Last health check
    std::optional<SystemClock::time_point> last_failure;///< Start of current unhealthy streak
    uint32_t recovery_attempts{0};                      ///< Attempts since last success
    bool has_health_check{false};                       ///< Health check registered
    bool has_recovery_function{false};                  ///< Recovery function registered
};

/**
 * @brief Point-in-time view of the whole manager
 */
struct FailoverStatus {
    FailoverState state{FailoverState::NORMAL};             ///< Global state
    std::map<std::string, ComponentSnapshot> components;    ///< Name -> component
    FailoverConfig config;                                  ///< Active configuration
    bool shutdown_triggered{false};                         ///< Shutdown fired in this emergency
    bool running{false};                                    ///< Supervision loop active
};

/**
 * @brief Supervisory loop over the trading client's components
 *
 * Health checks and recovery functions are owner-supplied collaborators.
 * They are always invoked without the manager lock held, so they may call
 * back into the manager's read methods. Exceptions they throw are caught
 * and turned into FAILED status; they never reach the caller or stop the
 * loop.
 *
 * Recovery backoff is a fixed interval, not exponential.
 *
 * @code
 * FailoverManager failover(config.failover);
 *
 * failover.set_health_check(component::API_CLIENT,
 *     make_api_client_check(server_time_probe, breakers));
 * failover.set_recovery_function(component::API_CLIENT,
 *     [&client]() { return client.reconnect(); });
 *
 * failover.set_notifier([](const std::string& msg) { alerts.send(msg); });
 * failover.set_shutdown_handler([&bot]() { bot.shutdown(); });
 *
 * failover.start();
 * ...
 * auto status = failover.get_failover_status();
 * failover.stop();
 * @endcode
 *
 * @note All public methods are thread-safe
 */
class FailoverManager {
public:
    /**
     * @brief Construct manager with the five fixed components
     *
     * @param config Configuration
     *
     * @throws std::invalid_argument if check_interval is not positive or
     *         recovery_backoff is negative
     */
    explicit FailoverManager(const FailoverConfig& config = FailoverConfig{});

    /**
     * @brief Destructor
     *
     * Stops the supervision loop if running.
     */
    ~FailoverManager();

    FailoverManager(const FailoverManager&) = delete;
    FailoverManager& operator=(const FailoverManager&) = delete;

    /**
     * @brief Register the health check of a component
     *
     * Components without a health check keep their last status and are
     * skipped by check_components().
     *
     * @param name Component name
     * @param check Health check
     *
     * @throws std::invalid_argument if the component does not exist
     */
    void set_health_check(const std::string& name, HealthCheckFn check);

    /**
     * @brief Register the recovery function of a component
     *
     * @throws std::invalid_argument if the component does not exist
     */
    void set_recovery_function(const std::string& name, RecoveryFn recovery);

    void set_notifier(NotifyFn notifier);
    void set_shutdown_handler(ShutdownFn shutdown);

    /**
     * @brief Start the supervision thread
     *
     * @return bool True if started, false if disabled, already running or
     *         called from the supervision thread
     */
    bool start();

    /**
     * @brief Stop the supervision thread
     *
     * Wakes the loop and joins it. Returns once the current iteration,
     * if any, has finished. Called from the supervision thread (a shutdown
     * handler) it only clears the running flag; the thread is joined by the
     * next start() or by the destructor.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Run one supervision cycle synchronously
     *
     * check_components(), update_state(), handle_failover(). Cycles never
     * overlap: a call made while the loop is mid-cycle waits for it.
     */
    void run_once();

    /**
     * @brief Poll every component's health check
     *
     * HEALTHY clears failure_count and last_failure; any other status
     * increments failure_count and stamps last_failure if unset. A check
     * that throws counts as FAILED.
     */
    void check_components();

    /**
     * @brief Derive the global state from component statuses
     *
     * Logs and notifies on change.
     *
     * @return FailoverState New global state
     */
    FailoverState update_state();

    /**
     * @brief Act on the current global state
     *
     * - DEGRADED: attempt recovery of WARNING components
     * - FAILOVER: log backup usage for failed critical components
     * - RECOVERY: re-check RECOVERING components, retry if still unhealthy
     * - EMERGENCY: attempt recovery of failed critical components; if all
     *   of them exhausted max_recovery_attempts, shut down (once per
     *   sustained emergency)
     */
    void handle_failover();

    /**
     * @brief Try to recover one component
     *
     * Gated by auto_recovery, a registered recovery function, the attempt
     * budget and the fixed backoff. The attempt counter and timestamp are
     * updated whether the attempt succeeds or not; success resets the
     * counter and marks the component HEALTHY, failure marks it FAILED.
     *
     * @param name Component name
     * @return bool True if a recovery ran and succeeded
     */
    bool attempt_recovery(const std::string& name);

    /**
     * @brief Force a component back to HEALTHY with counters cleared
     *
     * @param name Component name
     * @return bool False if the component does not exist
     */
    bool reset_component(const std::string& name);

    /**
     * @brief Replace the configuration
     *
     * Takes effect on the next cycle; the loop period changes after the
     * current wait.
     *
     * @param config New configuration
     * @return bool False (and no change) if the configuration is invalid
     */
    bool update_failover_config(const FailoverConfig& config);

    FailoverConfig get_config() const;
    FailoverState get_state() const;

    /**
     * @brief Snapshot of the state, every component and the configuration
     */
    FailoverStatus get_failover_status() const;

    /**
     * @brief Snapshot of one component
     *
     * @param name Component name
     * @return std::optional<ComponentSnapshot> Empty if unknown
     */
    std::optional<ComponentSnapshot> get_component_status(const std::string& name) const;

    /**
     * @brief Names of the supervised components, in registration order
     */
    static const std::vector<std::string>& component_names();

    /**
     * @brief Whether a component is critical
     *
     * @return bool False for unknown names
     */
    static bool is_critical(const std::string& name);

private:
    struct ComponentRecord {
        ComponentStatus status{ComponentStatus::HEALTHY};
        bool critical{false};
        HealthCheckFn check;
        RecoveryFn recover;
        std::optional<SystemClock::time_point> last_check;
        std::optional<SystemClock::time_point> last_failure;
        uint32_t failure_count{0};
        uint32_t recovery_attempts{0};
        std::optional<SteadyClock::time_point> last_recovery_time;
    };

    mutable std::mutex mutex_;                          ///< Protects everything below
    std::map<std::string, ComponentRecord> components_; ///< Name -> record
    FailoverState state_{FailoverState::NORMAL};        ///< Global state
    FailoverConfig config_;                             ///< Configuration
    bool shutdown_triggered_{false};                    ///< Shutdown fired this emergency
    NotifyFn notifier_;                                 ///< Notification collaborator
    ShutdownFn shutdown_handler_;                       ///< Shutdown collaborator

    std::mutex cycle_mutex_;                            ///< Serializes run_once()

    std::atomic<bool> running_{false};                  ///< Loop running flag
    std::unique_ptr<std::thread> loop_thread_;          ///< Supervision thread
    std::mutex wake_mutex_;                             ///< Guards wake_cv_ waits
    std::condition_variable wake_cv_;                   ///< Interrupts the interval wait

    void supervision_loop();

    void handle_degraded();
    void handle_failover_state();
    void handle_recovery();
    void handle_emergency();

    /**
     * @brief Re-check a RECOVERING component, retry recovery if needed
     */
    void continue_recovery(const std::string& name);

    /**
     * @brief Run a health check, converting exceptions to FAILED
     */
    static ComponentStatus run_health_check(const std::string& name, const HealthCheckFn& check);

    /**
     * @brief Names of components matching a predicate (takes mutex_)
     */
    std::vector<std::string> select_components(
        const std::function<bool(const ComponentRecord&)>& predicate) const;

    /**
     * @brief Send a notification if enabled (takes mutex_ briefly)
     */
    void notify(const std::string& message);

    // Caller must hold mutex_
    static void mark_healthy(ComponentRecord& record);
    static void validate_config(const FailoverConfig& config);
};

} // namespace tradeguard
