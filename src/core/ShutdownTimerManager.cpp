/* @file ShutdownTimerManager.cpp
 * @brief arm/disarm rules for the idle shutdown timers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// apctl headers
#include "core/ShutdownTimerManager.hpp"

using namespace apctl::core;

ShutdownTimerManager::ShutdownTimerManager(std::shared_ptr<Scheduler> scheduler,
                                           ExpiryHandler onExpired)
    : scheduler_(std::move(scheduler)), onExpired_(std::move(onExpired)) {
  if (!scheduler_)
    throw std::invalid_argument("[ShutdownTimerManager] scheduler is nullptr");
}

ShutdownTimerManager::~ShutdownTimerManager() { cancelAll(); }

bool ShutdownTimerManager::registerKey(const std::string& key) {
  return slots_.emplace(key, Slot{}).second;
}

void ShutdownTimerManager::remove(const std::string& key) {
  cancel(key);
  slots_.erase(key);
}

void ShutdownTimerManager::clear() {
  cancelAll();
  slots_.clear();
}

void ShutdownTimerManager::schedule(const std::string& key, std::chrono::milliseconds timeout) {
  auto it = slots_.find(key);
  if (it == slots_.end())
    return;
  if (it->second.id != Scheduler::kInvalidTimer)
    scheduler_->cancel(it->second.id);

  // the id is only known after postDelayed returns, so the task looks it up by key
  auto holder = std::make_shared<Scheduler::TimerId>(Scheduler::kInvalidTimer);
  Scheduler::TimerId id = scheduler_->postDelayed(
      [this, key, holder] { onFired(key, *holder); }, timeout);
  *holder = id;
  it->second.id = id;
  it->second.deadline = scheduler_->now() + timeout;
}

void ShutdownTimerManager::cancel(const std::string& key) {
  auto it = slots_.find(key);
  if (it == slots_.end() || it->second.id == Scheduler::kInvalidTimer)
    return;
  scheduler_->cancel(it->second.id);
  it->second.id = Scheduler::kInvalidTimer;
}

void ShutdownTimerManager::cancelAll() {
  for (auto& [key, slot] : slots_) {
    if (slot.id != Scheduler::kInvalidTimer) {
      scheduler_->cancel(slot.id);
      slot.id = Scheduler::kInvalidTimer;
    }
  }
}

bool ShutdownTimerManager::isArmed(const std::string& key) const {
  auto it = slots_.find(key);
  return it != slots_.end() && it->second.id != Scheduler::kInvalidTimer;
}

std::optional<Scheduler::Clock::time_point>
ShutdownTimerManager::deadline(const std::string& key) const {
  if (!isArmed(key))
    return std::nullopt;
  return slots_.at(key).deadline;
}

void ShutdownTimerManager::onFired(const std::string& key, Scheduler::TimerId id) {
  auto it = slots_.find(key);
  if (it == slots_.end() || it->second.id != id)
    return; // stale
  it->second.id = Scheduler::kInvalidTimer;
  if (onExpired_)
    onExpired_(key);
}

std::string ShutdownTimerManager::highestFrequencyInstance(const TimerContext& ctx) {
  std::string best;
  int bestFreq = -1;
  for (const auto& [instance, freq] : ctx.instanceFrequencies) {
    if (freq > bestFreq) {
      bestFreq = freq;
      best = instance;
    }
  }
  return best;
}

void ShutdownTimerManager::rescheduleIfNeeded(const std::string& key,
                                              std::chrono::milliseconds timeout,
                                              const TimerContext& ctx) {
  const bool wholeRadio = key == ctx.iface;
  const bool enabled = wholeRadio ? ctx.shutdownEnabled : ctx.instanceShutdownEnabled;

  std::size_t clients = ctx.totalClients;
  if (!wholeRadio) {
    auto it = ctx.instanceClients.find(key);
    clients = it == ctx.instanceClients.end() ? 0 : it->second;
  }

  if (!enabled || clients != 0) {
    cancel(key);
    return;
  }
  schedule(key, timeout);
}

std::chrono::milliseconds ShutdownTimerManager::instanceTimeout(const std::string& instance,
                                                                const TimerContext& ctx) {
  auto timeout = ctx.instanceShutdownTimeout;
  if (instance != highestFrequencyInstance(ctx))
    timeout += kLowerInstanceOffset;
  return timeout;
}

void ShutdownTimerManager::rescheduleBridgedInstances(const TimerContext& ctx) {
  for (const auto& [instance, freq] : ctx.instanceFrequencies)
    rescheduleIfNeeded(instance, instanceTimeout(instance, ctx), ctx);
}

void ShutdownTimerManager::reconcile(const std::string& changedKey, const TimerContext& ctx) {
  // with one instance left the bridged timers stay idle
  if (ctx.bridged && ctx.instanceFrequencies.size() == 2) {
    if (changedKey == ctx.iface)
      rescheduleBridgedInstances(ctx);
    else
      rescheduleIfNeeded(changedKey, instanceTimeout(changedKey, ctx), ctx);
  }
  rescheduleIfNeeded(ctx.iface, ctx.shutdownTimeout, ctx);
}
