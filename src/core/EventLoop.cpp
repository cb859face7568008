/* @file EventLoop.cpp
 * @brief worker thread draining ready tasks and due timers in order
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>

// apctl headers
#include "core/EventLoop.hpp"

using namespace apctl::core;

EventLoop::~EventLoop() { stop(); }

void EventLoop::start() {
  std::lock_guard<std::mutex> lock(queue_->mtx);
  if (queue_->running)
    return;
  queue_->running = true;
  worker_ = std::thread([queue = queue_] { run(queue); });
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(queue_->mtx);
    if (!queue_->running)
      return;
    queue_->running = false;
    queue_->ready.clear();
    queue_->delayed.clear();
  }
  queue_->cv.notify_all();
  if (!worker_.joinable())
    return;
  if (isLoopThread())
    worker_.detach(); // the worker holds its own reference to the queue
  else
    worker_.join();
}

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(queue_->mtx);
    queue_->ready.push_back(std::move(task));
  }
  queue_->cv.notify_one();
}

Scheduler::TimerId EventLoop::postDelayed(Task task, std::chrono::milliseconds delay) {
  TimerId id;
  {
    std::lock_guard<std::mutex> lock(queue_->mtx);
    id = queue_->nextId++;
    queue_->delayed.emplace(Clock::now() + delay, std::make_pair(id, std::move(task)));
  }
  queue_->cv.notify_one();
  return id;
}

void EventLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(queue_->mtx);
  auto& delayed = queue_->delayed;
  for (auto it = delayed.begin(); it != delayed.end(); ++it) {
    if (it->second.first == id) {
      delayed.erase(it);
      return;
    }
  }
}

void EventLoop::run(const std::shared_ptr<Queue>& queue) {
  std::unique_lock<std::mutex> lock(queue->mtx);
  while (queue->running) {
    const auto current = Clock::now();
    while (!queue->delayed.empty() && queue->delayed.begin()->first <= current) {
      queue->ready.push_back(std::move(queue->delayed.begin()->second.second));
      queue->delayed.erase(queue->delayed.begin());
    }

    if (!queue->ready.empty()) {
      Task task = std::move(queue->ready.front());
      queue->ready.pop_front();
      lock.unlock();
      try {
        task();
      } catch (const std::exception& e) {
        std::cerr << "[EventLoop] task threw: " << e.what() << '\n';
      }
      task = nullptr;
      lock.lock();
      continue;
    }

    if (queue->delayed.empty())
      queue->cv.wait(lock);
    else
      queue->cv.wait_until(lock, queue->delayed.begin()->first);
  }
}
