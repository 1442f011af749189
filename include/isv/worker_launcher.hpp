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
 * @file worker_launcher.hpp
 * @brief Boundary between the supervisor and the process layer.
 *
 * The supervisor asks a WorkerLauncher for workers; the process layer (and
 * the transport, once the worker dials back) reports what happened through
 * WorkerEventSink. Events may arrive on any thread, including from inside
 * Spawn() itself.
 */

#ifndef ISV_WORKER_LAUNCHER_HPP_
#define ISV_WORKER_LAUNCHER_HPP_

#include "isv/launch_spec.hpp"
#include "isv/vocabulary.hpp"
#include "isv/worker_remote.hpp"

#include <cstdint>
#include <string>

namespace isv {

class WorkerEventSink {
 public:
  virtual ~WorkerEventSink() = default;

  /// Bidirectional channel to the new worker is established.
  virtual void WorkerConnected(const WorkerHandle& worker) = 0;
  /// Worker process terminated, for any reason.
  virtual void WorkerQuit(int32_t status) = 0;
  /// Spawn or handshake failed before the worker connected.
  virtual void WorkerFailedToStart(const std::string& cause) = 0;
};

enum class LaunchError : uint8_t {
  kSpawnFailed = 0,  ///< Process could not be created or exec'd
  kShutDown          ///< Launcher already shut down
};

struct LaunchFailure {
  LaunchError error;
  std::string detail;
};

class WorkerLauncher {
 public:
  virtual ~WorkerLauncher() = default;

  /**
   * @brief Start one worker process.
   *
   * A synchronous failure is returned here and not reported through
   * @p sink; later events for this worker go to @p sink. A worker still
   * running from an earlier Spawn() is terminated first, and no further
   * events are reported for it.
   */
  virtual expected<void, LaunchFailure> Spawn(const LaunchSpec& spec,
                                              WorkerEventSink& sink) = 0;
  /// Ask the live worker, if any, to exit.
  virtual void RequestQuit() = 0;
  /// Kill the live worker, if any, without reporting its exit.
  virtual void Discard() = 0;
  /// Terminate any live worker and release all resources. Idempotent.
  virtual void Shutdown() = 0;
};

}  // namespace isv

#endif  // ISV_WORKER_LAUNCHER_HPP_
