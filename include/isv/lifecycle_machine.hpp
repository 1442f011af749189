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
 * @file lifecycle_machine.hpp
 * @brief Transition table of the worker lifecycle.
 *
 * Each operation is a free function over a LifecycleContext. They all follow
 * the same loop:
 *
 *   1. read the current state from the cell
 *   2. decide what this state does with the operation
 *   3. CAS to the successor state and perform the side effect, or
 *      wait for the state to change, or return
 *   4. if the CAS lost a race, go back to 1 against the new state
 *
 * No lock is held across an operation. A failed CAS never retries verbatim:
 * the loop always re-decides against the state that won, so no code ever
 * acts on a superseded worker handle. Waits share one deadline per
 * operation, so a burst of racing transitions cannot extend the bound.
 */

#ifndef ISV_LIFECYCLE_MACHINE_HPP_
#define ISV_LIFECYCLE_MACHINE_HPP_

#include "isv/diagnostics.hpp"
#include "isv/lifecycle_state.hpp"
#include "isv/log.hpp"
#include "isv/state_cell.hpp"
#include "isv/vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

namespace isv {

// ============================================================================
// SupervisorError
// ============================================================================

enum class SupervisorError : uint8_t {
  kAlreadyDisposed = 0,  ///< Operation issued after Dispose()
  kStateTimeout,         ///< A lifecycle wait expired where it must not
  kWorkerBusy,           ///< Worker still executing a previous call
  kWorkerFault,          ///< Worker reported an internal fault
  kDuplicateName         ///< Named interpreter already exists
};

inline const char* SupervisorErrorName(SupervisorError err) noexcept {
  switch (err) {
    case SupervisorError::kAlreadyDisposed: return "AlreadyDisposed";
    case SupervisorError::kStateTimeout:    return "StateTimeout";
    case SupervisorError::kWorkerBusy:      return "WorkerBusy";
    case SupervisorError::kWorkerFault:     return "WorkerFault";
    case SupervisorError::kDuplicateName:   return "DuplicateName";
    default:                                return "Unknown";
  }
}

// ============================================================================
// LifecycleActions - side effects triggered by transitions
// ============================================================================

/**
 * @brief Side effects performed right after a transition has been published.
 *
 * Implemented by Supervisor. Implementations may re-enter the transition
 * functions (a synchronous spawn failure reports WorkerFailedToStart from
 * inside SpawnWorker, for example).
 */
class LifecycleActions {
 public:
  virtual ~LifecycleActions() = default;

  /// Ask the process layer for a new worker.
  virtual void SpawnWorker() = 0;
  /// Ask the live worker to exit.
  virtual void RequestQuit() = 0;
  /// A new worker connected: apply pending settings and announce readiness.
  virtual void WorkerReady(const WorkerHandle& worker) = 0;
  /// Re-announce an unused worker instead of replacing it.
  virtual void AnnounceReady() = 0;
  virtual void Resetting() = 0;
  /// The worker exited without being asked to.
  virtual void UnsolicitedExit(int status) = 0;
  /// Startup failed max_startup_failures times in a row.
  virtual void StartupAbandoned(const std::string& cause) = 0;
  /// Disposed: release process-layer resources.
  virtual void ReleaseResources() = 0;
};

// ============================================================================
// LifecycleContext
// ============================================================================

struct LifecycleContext {
  AtomicStateCell<LifecycleState>& cell;
  LifecycleActions& actions;
  uint32_t max_startup_failures;
  std::chrono::milliseconds startup_timeout;
};

namespace lifecycle {

using Clock = std::chrono::steady_clock;
using Kind = LifecycleKind;
using VoidResult = expected<void, SupervisorError>;

static constexpr const char* kTag = "Lifecycle";

namespace detail {

inline VoidResult Ok() noexcept { return VoidResult::success(); }

inline VoidResult Fail(SupervisorError err) noexcept {
  return VoidResult::error(err);
}

/// @brief Wait until @p from is superseded or @p deadline passes.
inline expected<LifecycleStatePtr, StateCellError> AwaitChange(
    const LifecycleContext& ctx, const LifecycleStatePtr& from,
    Clock::time_point deadline) {
  Clock::time_point now = Clock::now();
  Clock::duration remaining =
      (deadline > now) ? (deadline - now) : Clock::duration::zero();
  return ctx.cell.AwaitChangeFrom(from, remaining);
}

/// @brief A wait that must not expire did: internal-consistency failure.
inline VoidResult WaitExpired(const char* operation,
                              const LifecycleStatePtr& stuck) {
  char detail[128];
  (void)std::snprintf(detail, sizeof(detail),
                      "%s timed out waiting to leave %s", operation,
                      stuck->name());
  RecordDiagnostic(DiagnosticCode::kStateTimeout, detail);
  return Fail(SupervisorError::kStateTimeout);
}

inline void UnexpectedEvent(const char* event, const LifecycleStatePtr& s) {
  char detail[128];
  (void)std::snprintf(detail, sizeof(detail), "%s while %s", event, s->name());
  RecordDiagnostic(DiagnosticCode::kUnexpectedEvent, detail);
}

inline void LogTransition(const LifecycleStatePtr& from,
                          const LifecycleStatePtr& to) {
  ISV_LOG_DEBUG(kTag, "%s -> %s", from->name(), to->name());
}

/// @brief CAS helper that logs the published transition.
inline bool Advance(LifecycleContext& ctx, const LifecycleStatePtr& from,
                    const LifecycleStatePtr& to) {
  if (!ctx.cell.CompareAndSet(from, to)) return false;
  LogTransition(from, to);
  return true;
}

}  // namespace detail

// ============================================================================
// Host-side operations
// ============================================================================

/// @brief Ensure a worker is starting or running.
inline VoidResult Start(LifecycleContext& ctx) {
  const Clock::time_point deadline = Clock::now() + ctx.startup_timeout;
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kFresh:
        if (detail::Advance(ctx, s, LifecycleState::Starting(0U))) {
          ctx.actions.SpawnWorker();
          return detail::Ok();
        }
        break;
      case Kind::kStarting:
      case Kind::kFreshRunning:
      case Kind::kRunning:
      case Kind::kRestarting:
        return detail::Ok();
      case Kind::kStopping: {
        auto next = detail::AwaitChange(ctx, s, deadline);
        if (!next) return detail::WaitExpired("start", s);
        s = next.value();
        continue;
      }
      case Kind::kDisposed:
        return detail::Fail(SupervisorError::kAlreadyDisposed);
    }
    s = ctx.cell.Get();
  }
}

/// @brief Ensure the worker is stopping or absent, without restart.
inline VoidResult Stop(LifecycleContext& ctx) {
  const Clock::time_point deadline = Clock::now() + ctx.startup_timeout;
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kFresh:
      case Kind::kStopping:
        return detail::Ok();
      case Kind::kStarting: {
        auto next = detail::AwaitChange(ctx, s, deadline);
        if (!next) return detail::WaitExpired("stop", s);
        s = next.value();
        continue;
      }
      case Kind::kFreshRunning:
      case Kind::kRunning:
        if (detail::Advance(ctx, s, LifecycleState::Stopping())) {
          ctx.actions.RequestQuit();
          return detail::Ok();
        }
        break;
      case Kind::kRestarting:
        // Quit already requested; only drop the intent to restart.
        if (detail::Advance(ctx, s, LifecycleState::Stopping())) {
          return detail::Ok();
        }
        break;
      case Kind::kDisposed:
        return detail::Fail(SupervisorError::kAlreadyDisposed);
    }
    s = ctx.cell.Get();
  }
}

/**
 * @brief Replace the worker with a fresh one.
 * @param force Replace even a worker that was never used.
 */
inline VoidResult Restart(LifecycleContext& ctx, bool force) {
  const Clock::time_point deadline = Clock::now() + ctx.startup_timeout;
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kFresh:
        return Start(ctx);
      case Kind::kStarting: {
        auto next = detail::AwaitChange(ctx, s, deadline);
        if (!next) return detail::WaitExpired("restart", s);
        s = next.value();
        continue;
      }
      case Kind::kFreshRunning:
        if (!force) {
          ctx.actions.AnnounceReady();
          return detail::Ok();
        }
        if (detail::Advance(ctx, s, LifecycleState::Restarting())) {
          ctx.actions.Resetting();
          ctx.actions.RequestQuit();
          // The host still expects a readiness notice for a fresh worker.
          ctx.actions.AnnounceReady();
          return detail::Ok();
        }
        break;
      case Kind::kRunning:
        if (detail::Advance(ctx, s, LifecycleState::Restarting())) {
          ctx.actions.Resetting();
          ctx.actions.RequestQuit();
          return detail::Ok();
        }
        break;
      case Kind::kRestarting:
        return detail::Ok();
      case Kind::kStopping:
        if (detail::Advance(ctx, s, LifecycleState::Restarting())) {
          return detail::Ok();
        }
        break;
      case Kind::kDisposed:
        return detail::Fail(SupervisorError::kAlreadyDisposed);
    }
    s = ctx.cell.Get();
  }
}

/// @brief Stop any worker and enter the terminal state. Idempotent.
inline VoidResult Dispose(LifecycleContext& ctx) {
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kDisposed:
        return detail::Ok();
      case Kind::kFresh:
      case Kind::kRestarting:
      case Kind::kStopping:
        if (detail::Advance(ctx, s, LifecycleState::Disposed())) {
          ctx.actions.ReleaseResources();
          return detail::Ok();
        }
        break;
      case Kind::kStarting:
      case Kind::kFreshRunning:
      case Kind::kRunning: {
        VoidResult stopped = Stop(ctx);
        if (!stopped && stopped.get_error() != SupervisorError::kAlreadyDisposed) {
          return stopped;
        }
        break;
      }
    }
    s = ctx.cell.Get();
  }
}

/**
 * @brief Obtain the live worker, waiting while one is being started.
 * @param used true if the caller will do real work with the worker; the
 *             first such call consumes the worker's freshness.
 * @return The handle, or nullptr when no worker is available in time.
 */
inline expected<WorkerHandle, SupervisorError> Interpreter(LifecycleContext& ctx,
                                                           bool used) {
  using Result = expected<WorkerHandle, SupervisorError>;
  const Clock::time_point deadline = Clock::now() + ctx.startup_timeout;
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kFresh:
      case Kind::kStopping:
        return Result::success(WorkerHandle());
      case Kind::kStarting: {
        auto next = detail::AwaitChange(ctx, s, deadline);
        if (!next) {
          ISV_LOG_WARN(kTag, "worker not connected within %lld ms",
                       static_cast<long long>(ctx.startup_timeout.count()));
          return Result::success(WorkerHandle());
        }
        s = next.value();
        continue;
      }
      case Kind::kFreshRunning:
        if (!used) return Result::success(s->worker());
        // Whoever wins, the worker is no longer fresh; re-read either way.
        (void)detail::Advance(ctx, s, LifecycleState::Running(s->worker()));
        break;
      case Kind::kRunning:
        return Result::success(s->worker());
      case Kind::kRestarting: {
        auto next = detail::AwaitChange(ctx, s, deadline);
        if (!next) {
          ISV_LOG_WARN(kTag, "worker restart did not complete within %lld ms",
                       static_cast<long long>(ctx.startup_timeout.count()));
          return Result::success(WorkerHandle());
        }
        // The restart may have settled back into Fresh; make sure a new
        // worker is actually on its way before asking for it.
        VoidResult started = Start(ctx);
        if (!started) {
          if (started.get_error() == SupervisorError::kAlreadyDisposed) {
            return Result::error(SupervisorError::kAlreadyDisposed);
          }
          return Result::success(WorkerHandle());
        }
        break;
      }
      case Kind::kDisposed:
        return Result::error(SupervisorError::kAlreadyDisposed);
    }
    s = ctx.cell.Get();
  }
}

// ============================================================================
// Worker-side events
// ============================================================================

/// @brief The spawned worker connected and its RPC endpoint is usable.
inline void WorkerConnected(LifecycleContext& ctx, const WorkerHandle& worker) {
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    if (s->kind() != Kind::kStarting) {
      detail::UnexpectedEvent("worker connected", s);
      return;
    }
    if (detail::Advance(ctx, s, LifecycleState::FreshRunning(worker))) {
      ctx.actions.WorkerReady(worker);
      return;
    }
    s = ctx.cell.Get();
  }
}

/// @brief Spawn or handshake failed before the worker connected.
inline void WorkerFailedToStart(LifecycleContext& ctx, const std::string& cause) {
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kStarting: {
        const uint32_t count = s->failures() + 1U;
        if (count < ctx.max_startup_failures) {
          ISV_LOG_WARN(kTag, "worker failed to start (attempt %u of %u): %s",
                       count, ctx.max_startup_failures, cause.c_str());
          if (detail::Advance(ctx, s, LifecycleState::Starting(count))) {
            ctx.actions.SpawnWorker();
            return;
          }
        } else {
          ISV_LOG_ERROR(kTag, "worker failed to start %u times, giving up: %s",
                        count, cause.c_str());
          if (detail::Advance(ctx, s, LifecycleState::Fresh())) {
            ctx.actions.StartupAbandoned(cause);
            return;
          }
        }
        break;
      }
      case Kind::kDisposed:
        ISV_LOG_DEBUG(kTag, "startup failure after dispose ignored: %s",
                      cause.c_str());
        return;
      default:
        detail::UnexpectedEvent("worker failed to start", s);
        return;
    }
    s = ctx.cell.Get();
  }
}

/**
 * @brief The worker process terminated, for any reason.
 * @param status Exit status (128 + signal number when killed by a signal).
 */
inline void WorkerQuit(LifecycleContext& ctx, int status) {
  LifecycleStatePtr s = ctx.cell.Get();
  for (;;) {
    switch (s->kind()) {
      case Kind::kFreshRunning:
      case Kind::kRunning:
        // Nobody asked it to go: the evaluated code exited or crashed.
        if (detail::Advance(ctx, s, LifecycleState::Restarting())) {
          ISV_LOG_WARN(kTag, "worker exited unexpectedly with status %d", status);
          ctx.actions.UnsolicitedExit(status);
          ctx.actions.Resetting();
        }
        break;
      case Kind::kRestarting:
        if (detail::Advance(ctx, s, LifecycleState::Fresh())) {
          VoidResult started = Start(ctx);
          if (!started) {
            ISV_LOG_WARN(kTag, "restart after worker exit failed: %s",
                         SupervisorErrorName(started.get_error()));
          }
          return;
        }
        break;
      case Kind::kStopping:
        if (detail::Advance(ctx, s, LifecycleState::Fresh())) return;
        break;
      case Kind::kStarting: {
        // Died before connecting: that is a failed start, not a quit.
        char cause[64];
        (void)std::snprintf(cause, sizeof(cause),
                            "worker exited with status %d before connecting",
                            status);
        WorkerFailedToStart(ctx, cause);
        return;
      }
      case Kind::kDisposed:
        return;
      case Kind::kFresh:
        detail::UnexpectedEvent("worker quit", s);
        return;
    }
    s = ctx.cell.Get();
  }
}

}  // namespace lifecycle
}  // namespace isv

#endif  // ISV_LIFECYCLE_MACHINE_HPP_
