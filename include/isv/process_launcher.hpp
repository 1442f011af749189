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
 * @file process_launcher.hpp
 * @brief WorkerLauncher backed by real child processes.
 *
 * Each spawned child gets a monitor thread that blocks until the child
 * exits and then reports WorkerQuit(status) with the shell convention
 * status (exit code, or 128 + signal). RequestQuit() sends SIGTERM;
 * Shutdown() sends SIGKILL and joins every monitor.
 *
 * At most one child is live. Spawn() and Discard() kill a child that is
 * still running (for example after a handshake timeout); the exit of such a
 * child is not reported.
 *
 * Connecting to the worker is the transport's job: it calls
 * WorkerEventSink::WorkerConnected() once the worker dials back.
 */

#ifndef ISV_PROCESS_LAUNCHER_HPP_
#define ISV_PROCESS_LAUNCHER_HPP_

#include "isv/launch_spec.hpp"
#include "isv/log.hpp"
#include "isv/process.hpp"
#include "isv/worker_launcher.hpp"

#if defined(ISV_PLATFORM_POSIX)

#include <atomic>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace isv {

class PosixWorkerLauncher final : public WorkerLauncher {
 public:
  PosixWorkerLauncher() = default;
  ~PosixWorkerLauncher() override { Shutdown(); }

  PosixWorkerLauncher(const PosixWorkerLauncher&) = delete;
  PosixWorkerLauncher& operator=(const PosixWorkerLauncher&) = delete;

  expected<void, LaunchFailure> Spawn(const LaunchSpec& spec,
                                      WorkerEventSink& sink) override {
    using Result = expected<void, LaunchFailure>;
    JoinFinished();

    std::lock_guard<std::mutex> lock(mtx_);
    if (shut_down_) {
      return Result::error(LaunchFailure{LaunchError::kShutDown, "launcher shut down"});
    }

    // At most one worker: a new attempt supersedes the previous child.
    DiscardLocked();

    std::vector<std::string> argv = LaunchArgv(spec);
    auto proc = std::make_unique<Subprocess>();
    auto started = proc->Start(argv, spec.working_dir);
    if (!started) {
      const SpawnFailure& f = started.get_error();
      std::string detail = std::string(SpawnErrorName(f.error)) + ": " +
                           std::strerror(f.sys_errno) + " (" + argv[0] + ")";
      ISV_LOG_WARN(kTag, "spawn failed: %s", detail.c_str());
      return Result::error(LaunchFailure{LaunchError::kSpawnFailed, detail});
    }

    ISV_LOG_INFO(kTag, "worker pid %d started: %s", static_cast<int>(proc->GetPid()),
                 argv[0].c_str());
    live_ = proc.get();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t(&PosixWorkerLauncher::MonitorLoop, this, std::move(proc), &sink, done);
    monitors_.push_back(Monitor{std::move(t), std::move(done)});
    return Result::success();
  }

  void RequestQuit() override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (live_ != nullptr) {
      ISV_LOG_DEBUG(kTag, "SIGTERM -> pid %d", static_cast<int>(live_->GetPid()));
      (void)live_->Signal(SIGTERM);
    }
  }

  void Discard() override {
    std::lock_guard<std::mutex> lock(mtx_);
    DiscardLocked();
  }

  void Shutdown() override {
    std::vector<Monitor> monitors;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      shut_down_ = true;
      if (live_ != nullptr) {
        ISV_LOG_DEBUG(kTag, "SIGKILL -> pid %d", static_cast<int>(live_->GetPid()));
        (void)live_->Signal(SIGKILL);
      }
      monitors.swap(monitors_);
    }
    JoinAll(monitors);
  }

  /// @brief PID of the live worker, -1 if none.
  pid_t LivePid() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return (live_ != nullptr) ? live_->GetPid() : -1;
  }

 private:
  static constexpr const char* kTag = "Launcher";

  struct Monitor {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void MonitorLoop(std::unique_ptr<Subprocess> proc, WorkerEventSink* sink,
                   std::shared_ptr<std::atomic<bool>> done) {
    (void)proc->AwaitExit();
    bool current = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      current = (live_ == proc.get());
      if (current) live_ = nullptr;
    }
    const pid_t pid = proc->GetPid();
    WaitResult wr = proc->Wait();
    if (current) {
      ISV_LOG_INFO(kTag, "worker pid %d exited with status %d",
                   static_cast<int>(pid), wr.Status());
      // May re-enter Spawn() from this thread.
      sink->WorkerQuit(wr.Status());
    } else {
      ISV_LOG_DEBUG(kTag, "superseded worker pid %d exited with status %d",
                    static_cast<int>(pid), wr.Status());
    }
    done->store(true, std::memory_order_release);
  }

  /// SIGKILL the live child and forget it; its monitor stays silent.
  void DiscardLocked() {
    if (live_ == nullptr) return;
    ISV_LOG_WARN(kTag, "discarding worker pid %d", static_cast<int>(live_->GetPid()));
    (void)live_->Signal(SIGKILL);
    live_ = nullptr;
  }

  /// Join monitors that have finished; never the calling thread.
  void JoinFinished() {
    std::vector<Monitor> finished;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      auto it = monitors_.begin();
      while (it != monitors_.end()) {
        if (it->done->load(std::memory_order_acquire) &&
            it->thread.get_id() != std::this_thread::get_id()) {
          finished.push_back(std::move(*it));
          it = monitors_.erase(it);
        } else {
          ++it;
        }
      }
    }
    JoinAll(finished);
  }

  static void JoinAll(std::vector<Monitor>& monitors) {
    for (Monitor& m : monitors) {
      if (!m.thread.joinable()) continue;
      if (m.thread.get_id() == std::this_thread::get_id()) {
        m.thread.detach();
      } else {
        m.thread.join();
      }
    }
  }

  mutable std::mutex mtx_;
  Subprocess* live_ = nullptr;
  bool shut_down_ = false;
  std::vector<Monitor> monitors_;
};

}  // namespace isv

#endif  // ISV_PLATFORM_POSIX

#endif  // ISV_PROCESS_LAUNCHER_HPP_
