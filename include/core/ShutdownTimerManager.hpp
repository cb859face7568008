#pragma once
/** @file  ShutdownTimerManager.hpp
 *  @brief Idle-timeout timers for the whole radio and each bridged instance.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "core/Scheduler.hpp"

namespace apctl::core {

  /// Snapshot of everything the arm/disarm decision depends on.
  struct TimerContext {
    std::string iface;                                    ///< key of the whole-radio timer
    bool bridged{ false };                                ///< active plan has two legs
    std::map<std::string, int> instanceFrequencies;       ///< up instances -> MHz
    std::map<std::string, std::size_t> instanceClients;   ///< clients per instance
    std::size_t totalClients{ 0 };

    bool shutdownEnabled{ true };
    std::chrono::milliseconds shutdownTimeout{ 0 };
    bool instanceShutdownEnabled{ true }; ///< already accounts for the plugged exemption
    std::chrono::milliseconds instanceShutdownTimeout{ 0 };
  };

  /**
 * @class ShutdownTimerManager
 * @brief Keyed one-shot timers on top of a Scheduler.
 *
 *  * A key must be registered (first ap-info for it) before it can be armed.
 *  * Re-arming restarts the countdown; firings of cancelled or re-armed
 *    timers are dropped.
 *  * The expiry handler runs on the scheduler and only enqueues.
 */
  class ShutdownTimerManager {
  public:
    using ExpiryHandler = std::function<void(const std::string& key)>;

    /// Added to the lower-frequency bridged instance so the higher band goes first.
    static constexpr std::chrono::milliseconds kLowerInstanceOffset{ 10 };

    ShutdownTimerManager(std::shared_ptr<Scheduler> scheduler, ExpiryHandler onExpired);
    ~ShutdownTimerManager(); ///< cancels everything still armed

    //---slots-----------------------------------------------------------
    /// @returns false if \p key was already registered.
    bool registerKey(const std::string& key);
    bool isRegistered(const std::string& key) const { return slots_.count(key) != 0; }
    void remove(const std::string& key);
    void clear();

    //---arming----------------------------------------------------------
    void schedule(const std::string& key, std::chrono::milliseconds timeout);
    void cancel(const std::string& key);
    void cancelAll();
    bool isArmed(const std::string& key) const;
    std::optional<Scheduler::Clock::time_point> deadline(const std::string& key) const;

    /**
     * @brief Re-evaluate the timers after \p changedKey changed.
     *
     * Passing the interface name re-evaluates both bridged instances (with the
     * lower-frequency offset). The whole-radio timer is always re-evaluated.
     */
    void reconcile(const std::string& changedKey, const TimerContext& ctx);

    /// Re-arm both bridged instance timers (plugged state or timeout changes).
    void rescheduleBridgedInstances(const TimerContext& ctx);

    //---non-copyable (pending tasks capture this)----------------------
    ShutdownTimerManager(const ShutdownTimerManager&) = delete;
    ShutdownTimerManager& operator=(const ShutdownTimerManager&) = delete;

  private:
    struct Slot {
      Scheduler::TimerId id{ Scheduler::kInvalidTimer };
      Scheduler::Clock::time_point deadline{};
    };

    void rescheduleIfNeeded(const std::string& key, std::chrono::milliseconds timeout,
                            const TimerContext& ctx);
    void onFired(const std::string& key, Scheduler::TimerId id);

    static std::string highestFrequencyInstance(const TimerContext& ctx);
    /// Instance timeout, plus the offset unless \p instance is the higher band.
    static std::chrono::milliseconds instanceTimeout(const std::string& instance,
                                                     const TimerContext& ctx);

    std::shared_ptr<Scheduler> scheduler_;
    ExpiryHandler onExpired_;
    std::map<std::string, Slot> slots_;
  };

} // namespace apctl::core
