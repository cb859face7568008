#pragma once
/** @file  Scheduler.hpp
 *  @brief Single ordered task queue with delayed tasks (the state machine's
 *         only execution context).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace apctl::core {

  /**
 * @class Scheduler
 * @brief Abstract serial executor.
 *
 *  * Tasks run one at a time, in post order; delayed tasks with the same due
 *    time run in the order they were scheduled.
 *  * `post()` / `postDelayed()` / `cancel()` are callable from any thread.
 */
  class Scheduler {
  public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    static constexpr TimerId kInvalidTimer = 0;

    virtual ~Scheduler() = default;

    virtual void post(Task task) = 0;
    virtual TimerId postDelayed(Task task, std::chrono::milliseconds delay) = 0;

    /// No-op for unknown or already fired timers.
    virtual void cancel(TimerId id) = 0;

    virtual Clock::time_point now() const = 0;
  };

} // namespace apctl::core
