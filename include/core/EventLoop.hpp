#pragma once
/** @file  EventLoop.hpp
 *  @brief Production Scheduler backed by one worker thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "core/Scheduler.hpp"

namespace apctl::core {

  class EventLoop : public Scheduler {
  public:
    EventLoop() = default;
    ~EventLoop() override; ///< stop + join

    //---public API------------------------------------------------------
    void start(); ///< launch the worker thread (idempotent)
    void stop();  ///< drop queued work, join the worker (detach when called from a task)

    void post(Task task) override;
    TimerId postDelayed(Task task, std::chrono::milliseconds delay) override;
    void cancel(TimerId id) override;
    Clock::time_point now() const override { return Clock::now(); }

    bool isLoopThread() const { return std::this_thread::get_id() == worker_.get_id(); }

    //---non-copyable (the worker is bound to this loop's queue)---------
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

  private:
    /// Queue state shared with the worker; outlives the loop when it is
    /// stopped (or destroyed) from one of its own tasks.
    struct Queue {
      std::deque<Task> ready;
      std::multimap<Clock::time_point, std::pair<TimerId, Task>> delayed;
      TimerId nextId{ 1 };
      bool running{ false };

      std::mutex mtx;
      std::condition_variable cv;
    };

    static void run(const std::shared_ptr<Queue>& queue);

    std::shared_ptr<Queue> queue_{ std::make_shared<Queue>() };
    std::thread worker_;
  };

} // namespace apctl::core
