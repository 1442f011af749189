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
 * @file supervisor.hpp
 * @brief Crash-tolerant front end of one supervised worker process.
 *
 * Supervisor owns the lifecycle cell, exposes start/stop/restart/dispose
 * and the worker RPC calls, and receives worker events from the process
 * layer (WorkerEventSink). Every RPC call degrades to a neutral result
 * (false / empty) when no worker is available; the error side of the
 * returned expected only carries misuse and internal-consistency failures.
 *
 * Usage:
 * @code
 *   isv::PosixWorkerLauncher launcher;
 *   isv::Supervisor sup(launcher, options);
 *   sup.SetInteractionsListener(&console);
 *   sup.Start();
 *   // ... transport calls sup.WorkerConnected(handle) ...
 *   sup.Interpret("2 + 2");
 *   sup.Dispose();
 * @endcode
 *
 * Thread safety: all public methods may be called from any thread.
 * Listeners are owned by the host and must outlive the supervisor, as must
 * the launcher, which is shut down with the supervisor.
 */

#ifndef ISV_SUPERVISOR_HPP_
#define ISV_SUPERVISOR_HPP_

#include "isv/diagnostics.hpp"
#include "isv/launch_spec.hpp"
#include "isv/lifecycle_machine.hpp"
#include "isv/lifecycle_state.hpp"
#include "isv/listeners.hpp"
#include "isv/log.hpp"
#include "isv/result_dispatcher.hpp"
#include "isv/state_cell.hpp"
#include "isv/supervisor_options.hpp"
#include "isv/vocabulary.hpp"
#include "isv/worker_launcher.hpp"
#include "isv/worker_remote.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <vector>

namespace isv {

class Supervisor final : public WorkerEventSink, private LifecycleActions {
 public:
  explicit Supervisor(WorkerLauncher& launcher,
                      const SupervisorOptions& options = SupervisorOptions())
      : launcher_(launcher),
        options_(options),
        cell_(LifecycleState::Fresh()),
        ctx_{cell_, *this, options.max_startup_failures,
             std::chrono::milliseconds(options.startup_timeout_ms)} {}

  ~Supervisor() override {
    auto r = lifecycle::Dispose(ctx_);
    if (!r) {
      ISV_LOG_ERROR(kTag, "dispose on destruction failed: %s",
                    SupervisorErrorName(r.get_error()));
    }
    // No launcher event may reach a destroyed supervisor.
    launcher_.Shutdown();
  }

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // ==========================================================================
  // Lifecycle
  // ==========================================================================

  expected<void, SupervisorError> Start() { return lifecycle::Start(ctx_); }
  expected<void, SupervisorError> Stop() { return lifecycle::Stop(ctx_); }
  /// @param force Replace the worker even if it has never been used.
  expected<void, SupervisorError> Restart(bool force) {
    return lifecycle::Restart(ctx_, force);
  }
  expected<void, SupervisorError> Dispose() { return lifecycle::Dispose(ctx_); }

  LifecycleKind CurrentKind() const noexcept { return cell_.Get()->kind(); }

  // ==========================================================================
  // Worker RPC
  // ==========================================================================

  /**
   * @brief Evaluate @p expression; the outcome goes to the interactions
   *        listener.
   * @return false if no worker was available or the call did not complete.
   */
  expected<bool, SupervisorError> Interpret(const std::string& expression) {
    using Result = expected<bool, SupervisorError>;
    auto w = lifecycle::Interpreter(ctx_, true);
    if (!w) return Result::error(w.get_error());
    const WorkerHandle& worker = w.value();
    if (!worker) return Result::success(false);

    auto outcome = worker->Interpret(expression);
    if (!outcome) {
      HandleRemoteError("Interpret", outcome.get_error());
      return Result::success(false);
    }
    auto dispatched = ResultDispatcher::Dispatch(outcome.value(), Interactions());
    if (!dispatched) {
      if (dispatched.get_error() == DispatchError::kWorkerBusy) {
        ISV_LOG_ERROR(kTag, "interpret issued while the worker was busy");
        return Result::error(SupervisorError::kWorkerBusy);
      }
      ISV_LOG_ERROR(kTag, "worker fault: %s",
                    std::get<UnexpectedFailure>(outcome.value()).detail.c_str());
      return Result::error(SupervisorError::kWorkerFault);
    }
    return Result::success(true);
  }

  expected<optional<std::string>, SupervisorError> GetVariableText(
      const std::string& name) {
    return Query<std::string>("GetVariableText", false, [&](WorkerRemote& w) {
      return w.GetVariableText(name);
    });
  }

  expected<optional<std::string>, SupervisorError> GetVariableType(
      const std::string& name) {
    return Query<std::string>("GetVariableType", false, [&](WorkerRemote& w) {
      return w.GetVariableType(name);
    });
  }

  expected<bool, SupervisorError> AddClassPath(ClassPathKind kind,
                                               const std::string& path) {
    return Call("AddClassPath", [&](WorkerRemote& w) {
      return w.AddClassPath(kind, path);
    });
  }

  /// @return Worker class path in order, duplicates removed.
  expected<optional<std::vector<std::string>>, SupervisorError> GetClassPath() {
    using Paths = std::vector<std::string>;
    auto r = Query<Paths>("GetClassPath", false,
                          [](WorkerRemote& w) { return w.GetClassPath(); });
    if (!r || !r.value().has_value()) return r;
    Paths unique;
    std::unordered_set<std::string> seen;
    for (std::string& p : *r.value()) {
      if (seen.insert(p).second) unique.push_back(std::move(p));
    }
    return expected<optional<Paths>, SupervisorError>::success(
        optional<Paths>(std::move(unique)));
  }

  /// @brief Make @p name the package of subsequent interactions.
  expected<bool, SupervisorError> SetPackageScope(const std::string& name) {
    const std::string statement = "package " + name + ";";
    return Call("SetPackageScope", [&](WorkerRemote& w) {
      auto r = w.Interpret(statement);
      return r ? expected<void, RemoteError>::success()
               : expected<void, RemoteError>::error(r.get_error());
    });
  }

  /// @return The subset of @p class_names that are runnable test classes.
  expected<optional<std::vector<std::string>>, SupervisorError> FindTestClasses(
      const std::vector<std::string>& class_names,
      const std::vector<std::string>& files) {
    return Query<std::vector<std::string>>(
        "FindTestClasses", false,
        [&](WorkerRemote& w) { return w.FindTestClasses(class_names, files); });
  }

  /// @brief Run the suite cached by the last FindTestClasses().
  expected<bool, SupervisorError> RunTestSuite() {
    auto r = Query<bool>("RunTestSuite", true,
                         [](WorkerRemote& w) { return w.RunTestSuite(); });
    if (!r) return expected<bool, SupervisorError>::error(r.get_error());
    return expected<bool, SupervisorError>::success(r.value().value_or(false));
  }

  /// @return kDuplicateName if an interpreter called @p name exists.
  expected<bool, SupervisorError> AddInterpreter(const std::string& name) {
    using Result = expected<bool, SupervisorError>;
    auto w = lifecycle::Interpreter(ctx_, false);
    if (!w) return Result::error(w.get_error());
    if (!w.value()) return Result::success(false);
    auto r = w.value()->AddInterpreter(name);
    if (!r) {
      if (r.get_error() == RemoteError::kRejected) {
        ISV_LOG_WARN(kTag, "interpreter '%s' already exists", name.c_str());
        return Result::error(SupervisorError::kDuplicateName);
      }
      HandleRemoteError("AddInterpreter", r.get_error());
      return Result::success(false);
    }
    return Result::success(true);
  }

  expected<bool, SupervisorError> RemoveInterpreter(const std::string& name) {
    return Call("RemoveInterpreter", [&](WorkerRemote& w) {
      return w.RemoveInterpreter(name);
    });
  }

  expected<optional<InterpreterStatus>, SupervisorError> SetActiveInterpreter(
      const std::string& name) {
    return Query<InterpreterStatus>(
        "SetActiveInterpreter", false,
        [&](WorkerRemote& w) { return w.SetActiveInterpreter(name); });
  }

  expected<optional<InterpreterStatus>, SupervisorError> SetToDefaultInterpreter() {
    return Query<InterpreterStatus>(
        "SetToDefaultInterpreter", false,
        [](WorkerRemote& w) { return w.SetToDefaultInterpreter(); });
  }

  /**
   * @brief Allow evaluated code to reach private members. Remembered for
   *        future workers and applied to the live one.
   */
  expected<bool, SupervisorError> SetPrivateAccessible(bool allow) {
    SetAllowPrivateAccess(allow);
    return Call("SetPrivateAccessible", [allow](WorkerRemote& w) {
      return w.SetPrivateAccessible(allow);
    });
  }

  // ==========================================================================
  // Callbacks from the worker
  // ==========================================================================

  void PrintStdout(const std::string& text) { Interactions().OnStdout(text); }
  void PrintStderr(const std::string& text) { Interactions().OnStderr(text); }
  std::string ConsoleInput() { return Interactions().ConsoleInput(); }

  void TestSuiteStarted(int32_t test_count) { TestRun().OnSuiteStarted(test_count); }
  void TestStarted(const std::string& name) { TestRun().OnTestStarted(name); }
  void TestEnded(const std::string& name, bool passed, bool was_error) {
    TestRun().OnTestEnded(name, passed, was_error);
  }
  void TestSuiteEnded(const std::vector<TestError>& errors) {
    TestRun().OnSuiteEnded(errors);
  }
  void NonTestCase(bool run_all) { TestRun().OnNonTestCase(run_all); }
  void ReportClassFileError(const ClassFileError& details) {
    TestRun().OnClassFileError(details);
  }
  std::string FileForClassName(const std::string& class_name) {
    return TestRun().FileForClass(class_name);
  }
  void DebugInterpreterAssigned(const std::string& name) {
    Debug().OnDebugInterpreterAssigned(name);
  }

  // ==========================================================================
  // WorkerEventSink
  // ==========================================================================

  void WorkerConnected(const WorkerHandle& worker) override {
    if (!worker) {
      RecordDiagnostic(DiagnosticCode::kUnexpectedEvent,
                       "worker connected without an endpoint");
      return;
    }
    lifecycle::WorkerConnected(ctx_, worker);
  }
  void WorkerQuit(int32_t status) override { lifecycle::WorkerQuit(ctx_, status); }
  void WorkerFailedToStart(const std::string& cause) override {
    lifecycle::WorkerFailedToStart(ctx_, cause);
  }

  // ==========================================================================
  // Launch settings (take effect on the next spawn)
  // ==========================================================================

  void SetAllowAssertions(bool allow) {
    std::lock_guard<std::mutex> lock(options_mtx_);
    options_.allow_assertions = allow;
  }
  /// @param path_list Entries joined by the platform path separator.
  void SetStartupClassPath(const std::string& path_list) {
    std::lock_guard<std::mutex> lock(options_mtx_);
    options_.class_path = SplitPathList(path_list);
  }
  /// @param dir Empty for the host's current directory.
  void SetWorkingDirectory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(options_mtx_);
    options_.working_dir = dir;
  }
  void SetAllowPrivateAccess(bool allow) {
    std::lock_guard<std::mutex> lock(options_mtx_);
    options_.allow_private_access = allow;
  }
  /// @param mb 0 for the worker's default.
  void SetHeapSizeMb(uint32_t mb) {
    std::lock_guard<std::mutex> lock(options_mtx_);
    options_.heap_size_mb = mb;
  }
  void SetExtraArguments(const std::string& args) {
    std::lock_guard<std::mutex> lock(options_mtx_);
    options_.extra_args = args;
  }

  SupervisorOptions Options() const {
    std::lock_guard<std::mutex> lock(options_mtx_);
    return options_;
  }

  // ==========================================================================
  // Listeners (nullptr restores the no-op default; last write wins)
  // ==========================================================================

  void SetInteractionsListener(InteractionsListener* listener) noexcept {
    interactions_.store(listener, std::memory_order_relaxed);
  }
  void SetTestRunListener(TestRunListener* listener) noexcept {
    test_run_.store(listener, std::memory_order_relaxed);
  }
  void SetDebugListener(DebugListener* listener) noexcept {
    debug_.store(listener, std::memory_order_relaxed);
  }

 private:
  static constexpr const char* kTag = "Supervisor";

  InteractionsListener& Interactions() const noexcept {
    static InteractionsListener no_op;
    InteractionsListener* l = interactions_.load(std::memory_order_relaxed);
    return (l != nullptr) ? *l : no_op;
  }
  TestRunListener& TestRun() const noexcept {
    static TestRunListener no_op;
    TestRunListener* l = test_run_.load(std::memory_order_relaxed);
    return (l != nullptr) ? *l : no_op;
  }
  DebugListener& Debug() const noexcept {
    static DebugListener no_op;
    DebugListener* l = debug_.load(std::memory_order_relaxed);
    return (l != nullptr) ? *l : no_op;
  }

  /// Worker vanishing mid-call is an expected side effect of a reset.
  void HandleRemoteError(const char* call, RemoteError err) {
    if (err == RemoteError::kDisconnected) {
      ISV_LOG_DEBUG(kTag, "%s: worker disconnected", call);
      return;
    }
    char detail[128];
    (void)std::snprintf(detail, sizeof(detail), "%s: %s", call,
                        RemoteErrorName(err));
    RecordDiagnostic(DiagnosticCode::kTransportFailure, detail);
  }

  /// RPC returning a value: neutral result is an empty optional.
  template <typename T, typename Fn>
  expected<optional<T>, SupervisorError> Query(const char* call, bool used,
                                               Fn&& fn) {
    using Result = expected<optional<T>, SupervisorError>;
    auto w = lifecycle::Interpreter(ctx_, used);
    if (!w) return Result::error(w.get_error());
    const WorkerHandle& worker = w.value();
    if (!worker) return Result::success(optional<T>());
    expected<T, RemoteError> r = fn(*worker);
    if (!r) {
      HandleRemoteError(call, r.get_error());
      return Result::success(optional<T>());
    }
    return Result::success(optional<T>(std::move(r).value()));
  }

  /// RPC without a value, status-check only: neutral result is false.
  template <typename Fn>
  expected<bool, SupervisorError> Call(const char* call, Fn&& fn) {
    using Result = expected<bool, SupervisorError>;
    auto w = lifecycle::Interpreter(ctx_, false);
    if (!w) return Result::error(w.get_error());
    const WorkerHandle& worker = w.value();
    if (!worker) return Result::success(false);
    expected<void, RemoteError> r = fn(*worker);
    if (!r) {
      HandleRemoteError(call, r.get_error());
      return Result::success(false);
    }
    return Result::success(true);
  }

  std::string WorkingDirectory() const {
    std::string dir = Options().working_dir;
    if (!dir.empty()) return dir;
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::string(".") : cwd.string();
  }

  // --- LifecycleActions ---

  void SpawnWorker() override {
    LaunchSpec spec = BuildLaunchSpec(Options(), Interactions().DebugPort());
    auto r = launcher_.Spawn(spec, *this);
    if (!r) {
      RecordDiagnostic(DiagnosticCode::kLaunchFailure, r.get_error().detail.c_str());
      lifecycle::WorkerFailedToStart(ctx_, r.get_error().detail);
    }
  }

  void RequestQuit() override { launcher_.RequestQuit(); }

  void WorkerReady(const WorkerHandle& worker) override {
    const bool allow = Options().allow_private_access;
    auto r = worker->SetPrivateAccessible(allow);
    if (!r) HandleRemoteError("SetPrivateAccessible", r.get_error());
    ISV_LOG_INFO(kTag, "worker ready");
    Interactions().OnReady(WorkingDirectory());
    TestRun().OnWorkerReady();
  }

  void AnnounceReady() override { Interactions().OnReady(WorkingDirectory()); }

  void Resetting() override { Interactions().OnResetting(); }

  void UnsolicitedExit(int status) override { Interactions().OnCalledExit(status); }

  void StartupAbandoned(const std::string& cause) override {
    // Fresh: no worker may outlive the last failed attempt.
    launcher_.Discard();
    Interactions().OnWontStart(cause);
  }

  void ReleaseResources() override { launcher_.Shutdown(); }

  WorkerLauncher& launcher_;
  mutable std::mutex options_mtx_;
  SupervisorOptions options_;
  AtomicStateCell<LifecycleState> cell_;
  LifecycleContext ctx_;

  std::atomic<InteractionsListener*> interactions_{nullptr};
  std::atomic<TestRunListener*> test_run_{nullptr};
  std::atomic<DebugListener*> debug_{nullptr};
};

}  // namespace isv

#endif  // ISV_SUPERVISOR_HPP_
