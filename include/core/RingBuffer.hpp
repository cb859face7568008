#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO shared by one producer side and the log worker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace apctl::core {

  /**
 * @class RingBuffer
 * @brief Bounded queue; `push()` never blocks and fails when full.
 *
 *  * Mutex-protected; callers may push from any thread.
 */
  template <typename T> class RingBuffer {
  public:
    explicit RingBuffer(std::size_t capacity) : slots_(capacity ? capacity : 1) {}

    /// @returns false (and drops \p value) when the buffer is full.
    bool push(T value) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (count_ == slots_.size())
        return false;
      slots_[(head_ + count_) % slots_.size()] = std::move(value);
      ++count_;
      return true;
    }

    std::optional<T> pop() {
      std::lock_guard<std::mutex> lock(mtx_);
      if (count_ == 0)
        return std::nullopt;
      T value = std::move(slots_[head_]);
      head_ = (head_ + 1) % slots_.size();
      --count_;
      return value;
    }

    std::size_t size() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return count_;
    }

    bool empty() const { return size() == 0; }
    std::size_t capacity() const { return slots_.size(); }

  private:
    std::vector<T> slots_;
    std::size_t head_{ 0 };
    std::size_t count_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace apctl::core
