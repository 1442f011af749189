/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file state_cell.hpp
 * @brief Single-value coordination cell: lock-free compare-and-set plus a
 *        bounded "wait until the value changes" primitive.
 *
 * Values are immutable and published as std::shared_ptr<const T>. Equality
 * is identity of the published object, so two separately constructed but
 * equal-looking values never compare equal. A superseded value stays alive
 * for as long as some reader still holds it.
 *
 * Writers never block: CompareAndSet() is one atomic CAS on the pointer.
 * The mutex/condvar pair only parks threads inside AwaitChangeFrom().
 */

#ifndef ISV_STATE_CELL_HPP_
#define ISV_STATE_CELL_HPP_

#include "isv/platform.hpp"
#include "isv/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

namespace isv {

enum class StateCellError : uint8_t { kTimeout = 0 };

/**
 * @brief Holds the current value of a state machine.
 *
 * @tparam T Immutable state type.
 *
 * @code
 *   isv::AtomicStateCell<Mode> cell(std::make_shared<const Mode>(kIdle));
 *   auto cur = cell.Get();
 *   if (!cell.CompareAndSet(cur, std::make_shared<const Mode>(kBusy))) {
 *     // someone else moved first: re-read and decide again
 *   }
 * @endcode
 */
template <typename T>
class AtomicStateCell final {
 public:
  using Value = std::shared_ptr<const T>;

  explicit AtomicStateCell(Value initial) : value_(std::move(initial)) {
    ISV_ASSERT(value_ != nullptr);
  }

  AtomicStateCell(const AtomicStateCell&) = delete;
  AtomicStateCell& operator=(const AtomicStateCell&) = delete;
  AtomicStateCell(AtomicStateCell&&) = delete;
  AtomicStateCell& operator=(AtomicStateCell&&) = delete;

  /// @brief Current value.
  Value Get() const noexcept {
    return std::atomic_load_explicit(&value_, std::memory_order_acquire);
  }

  /**
   * @brief Replace the current value with @p next iff it is @p from.
   * @return true if this call published @p next.
   */
  bool CompareAndSet(const Value& from, Value next) noexcept {
    Value observed = from;
    if (!std::atomic_compare_exchange_strong_explicit(
            &value_, &observed, std::move(next), std::memory_order_acq_rel,
            std::memory_order_acquire)) {
      return false;
    }
    // Empty critical section orders the publish before any waiter's
    // predicate check, so a notify cannot slip between check and sleep.
    { std::lock_guard<std::mutex> lk(mtx_); }
    cv_.notify_all();
    return true;
  }

  /**
   * @brief Block until the current value is no longer @p from.
   * @param from    Value the caller observed.
   * @param timeout  Maximum time to block.
   * @return The new value, or StateCellError::kTimeout.
   */
  template <typename Rep, typename Period>
  expected<Value, StateCellError> AwaitChangeFrom(
      const Value& from,
      std::chrono::duration<Rep, Period> timeout) const {
    Value current = Get();
    if (current != from) {
      return expected<Value, StateCellError>::success(std::move(current));
    }
    std::unique_lock<std::mutex> lk(mtx_);
    bool changed = cv_.wait_for(lk, timeout, [&]() {
      current = Get();
      return current != from;
    });
    if (!changed) {
      return expected<Value, StateCellError>::error(
          StateCellError::kTimeout);
    }
    return expected<Value, StateCellError>::success(std::move(current));
  }

 private:
  Value value_;
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
};

}  // namespace isv

#endif  // ISV_STATE_CELL_HPP_
