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
 * @file lifecycle_state.hpp
 * @brief Immutable lifecycle state of the supervised worker.
 *
 *   Fresh --start--> Starting(n) --connected--> FreshRunning --used--> Running
 *     ^                  |  failed (n+1 < bound): Starting(n+1)
 *     |                  |  failed (bound reached): Fresh
 *     +--quit-- Stopping <--stop-- FreshRunning / Running
 *     +--quit-- Restarting <--restart / unsolicited quit-- Running  (then start)
 *   any non-terminal --dispose--> Disposed (absorbing)
 *
 * A state value is never modified after construction; transitions publish a
 * new value through AtomicStateCell.
 */

#ifndef ISV_LIFECYCLE_STATE_HPP_
#define ISV_LIFECYCLE_STATE_HPP_

#include "isv/worker_remote.hpp"

#include <cstdint>
#include <memory>
#include <utility>

namespace isv {

enum class LifecycleKind : uint8_t {
  kFresh = 0,     ///< No worker; never started or fully stopped
  kStarting,      ///< Spawn requested, worker not yet connected
  kFreshRunning,  ///< Connected, never used for real work
  kRunning,       ///< Connected and used at least once
  kRestarting,    ///< Stop requested, new worker to follow
  kStopping,      ///< Stop requested, no restart
  kDisposed       ///< Terminal
};

inline const char* LifecycleKindName(LifecycleKind kind) noexcept {
  switch (kind) {
    case LifecycleKind::kFresh:        return "Fresh";
    case LifecycleKind::kStarting:     return "Starting";
    case LifecycleKind::kFreshRunning: return "FreshRunning";
    case LifecycleKind::kRunning:      return "Running";
    case LifecycleKind::kRestarting:   return "Restarting";
    case LifecycleKind::kStopping:     return "Stopping";
    case LifecycleKind::kDisposed:     return "Disposed";
    default:                           return "Unknown";
  }
}

class LifecycleState;
using LifecycleStatePtr = std::shared_ptr<const LifecycleState>;

/**
 * @brief One value of the lifecycle tagged union.
 *
 * failures() is meaningful only for kStarting, worker() only for
 * kFreshRunning / kRunning (null otherwise).
 */
class LifecycleState final {
 public:
  static LifecycleStatePtr Fresh() { return Make(LifecycleKind::kFresh, 0U, nullptr); }
  static LifecycleStatePtr Starting(uint32_t failures) {
    return Make(LifecycleKind::kStarting, failures, nullptr);
  }
  static LifecycleStatePtr FreshRunning(WorkerHandle worker) {
    return Make(LifecycleKind::kFreshRunning, 0U, std::move(worker));
  }
  static LifecycleStatePtr Running(WorkerHandle worker) {
    return Make(LifecycleKind::kRunning, 0U, std::move(worker));
  }
  static LifecycleStatePtr Restarting() { return Make(LifecycleKind::kRestarting, 0U, nullptr); }
  static LifecycleStatePtr Stopping() { return Make(LifecycleKind::kStopping, 0U, nullptr); }
  static LifecycleStatePtr Disposed() { return Make(LifecycleKind::kDisposed, 0U, nullptr); }

  LifecycleKind kind() const noexcept { return kind_; }
  uint32_t failures() const noexcept { return failures_; }
  const WorkerHandle& worker() const noexcept { return worker_; }
  const char* name() const noexcept { return LifecycleKindName(kind_); }

  bool HasWorker() const noexcept {
    return kind_ == LifecycleKind::kFreshRunning || kind_ == LifecycleKind::kRunning;
  }

 private:
  LifecycleState(LifecycleKind kind, uint32_t failures, WorkerHandle worker) noexcept
      : kind_(kind), failures_(failures), worker_(std::move(worker)) {}

  static LifecycleStatePtr Make(LifecycleKind kind, uint32_t failures,
                                WorkerHandle worker) {
    return LifecycleStatePtr(new LifecycleState(kind, failures, std::move(worker)));
  }

  const LifecycleKind kind_;
  const uint32_t failures_;
  const WorkerHandle worker_;
};

}  // namespace isv

#endif  // ISV_LIFECYCLE_STATE_HPP_
