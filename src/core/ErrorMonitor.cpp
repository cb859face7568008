/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault aggregator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// apctl headers
#include "core/ErrorMonitor.hpp"

using namespace apctl::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    cb = escalation_;
  }
  // called unlocked so the callback may report further failures
  if (cb)
    cb(message);
}

std::vector<std::string> ErrorMonitor::failures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_.size();
}

void ErrorMonitor::reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}
