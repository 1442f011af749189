/**
 * @file test_support.hpp
 * @brief In-process fakes for the process layer, the worker and listeners.
 */

#ifndef ISV_TESTS_TEST_SUPPORT_HPP_
#define ISV_TESTS_TEST_SUPPORT_HPP_

#include "isv/listeners.hpp"
#include "isv/worker_launcher.hpp"
#include "isv/worker_remote.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace isv_test {

using namespace isv;

// ============================================================================
// FakeLauncher - counts requests, optionally fails Spawn synchronously
// ============================================================================

class FakeLauncher final : public WorkerLauncher {
 public:
  expected<void, LaunchFailure> Spawn(const LaunchSpec& spec,
                                      WorkerEventSink& sink) override {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      last_spec_ = spec;
    }
    sink_.store(&sink);
    spawn_count_.fetch_add(1U);
    if (fail_spawn_.load()) {
      return expected<void, LaunchFailure>::error(
          LaunchFailure{LaunchError::kSpawnFailed, "no such program"});
    }
    return expected<void, LaunchFailure>::success();
  }

  void RequestQuit() override { quit_count_.fetch_add(1U); }
  void Discard() override { discard_count_.fetch_add(1U); }
  void Shutdown() override { shutdown_count_.fetch_add(1U); }

  uint32_t SpawnCount() const { return spawn_count_.load(); }
  uint32_t QuitCount() const { return quit_count_.load(); }
  uint32_t ShutdownCount() const { return shutdown_count_.load(); }
  uint32_t DiscardCount() const { return discard_count_.load(); }
  void SetFailSpawn(bool fail) { fail_spawn_.store(fail); }

  LaunchSpec LastSpec() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_spec_;
  }

 private:
  std::atomic<uint32_t> spawn_count_{0U};
  std::atomic<uint32_t> quit_count_{0U};
  std::atomic<uint32_t> shutdown_count_{0U};
  std::atomic<uint32_t> discard_count_{0U};
  std::atomic<bool> fail_spawn_{false};
  std::atomic<WorkerEventSink*> sink_{nullptr};
  mutable std::mutex mtx_;
  LaunchSpec last_spec_;
};

// ============================================================================
// FakeWorker - scripted WorkerRemote
// ============================================================================

class FakeWorker final : public WorkerRemote {
 public:
  InterpretOutcome next_outcome = NoValue{};
  std::vector<std::string> class_path;
  std::vector<std::string> interpreters;
  /// When set, every call fails with this error.
  bool fail = false;
  RemoteError fail_with = RemoteError::kTransportFailure;

  std::vector<std::string> interpreted;
  std::atomic<int> private_access{-1};
  std::atomic<uint32_t> calls{0U};

  expected<InterpretOutcome, RemoteError> Interpret(
      const std::string& expression) override {
    ++calls;
    if (fail) return expected<InterpretOutcome, RemoteError>::error(fail_with);
    interpreted.push_back(expression);
    return expected<InterpretOutcome, RemoteError>::success(next_outcome);
  }

  expected<std::string, RemoteError> GetVariableText(
      const std::string& name) override {
    ++calls;
    if (fail) return expected<std::string, RemoteError>::error(fail_with);
    return expected<std::string, RemoteError>::success("text of " + name);
  }

  expected<std::string, RemoteError> GetVariableType(
      const std::string& name) override {
    ++calls;
    if (fail) return expected<std::string, RemoteError>::error(fail_with);
    return expected<std::string, RemoteError>::success("type of " + name);
  }

  expected<void, RemoteError> AddClassPath(ClassPathKind,
                                           const std::string& path) override {
    ++calls;
    if (fail) return expected<void, RemoteError>::error(fail_with);
    class_path.push_back(path);
    return expected<void, RemoteError>::success();
  }

  expected<std::vector<std::string>, RemoteError> GetClassPath() override {
    ++calls;
    if (fail) {
      return expected<std::vector<std::string>, RemoteError>::error(fail_with);
    }
    return expected<std::vector<std::string>, RemoteError>::success(class_path);
  }

  expected<std::vector<std::string>, RemoteError> FindTestClasses(
      const std::vector<std::string>& class_names,
      const std::vector<std::string>&) override {
    ++calls;
    if (fail) {
      return expected<std::vector<std::string>, RemoteError>::error(fail_with);
    }
    std::vector<std::string> tests;
    for (const std::string& n : class_names) {
      if (n.size() > 4U && n.compare(n.size() - 4U, 4U, "Test") == 0) {
        tests.push_back(n);
      }
    }
    return expected<std::vector<std::string>, RemoteError>::success(tests);
  }

  expected<bool, RemoteError> RunTestSuite() override {
    ++calls;
    if (fail) return expected<bool, RemoteError>::error(fail_with);
    return expected<bool, RemoteError>::success(true);
  }

  expected<void, RemoteError> AddInterpreter(const std::string& name) override {
    ++calls;
    if (fail) return expected<void, RemoteError>::error(fail_with);
    for (const std::string& n : interpreters) {
      if (n == name) return expected<void, RemoteError>::error(RemoteError::kRejected);
    }
    interpreters.push_back(name);
    return expected<void, RemoteError>::success();
  }

  expected<void, RemoteError> RemoveInterpreter(const std::string& name) override {
    ++calls;
    if (fail) return expected<void, RemoteError>::error(fail_with);
    for (auto it = interpreters.begin(); it != interpreters.end(); ++it) {
      if (*it == name) {
        interpreters.erase(it);
        break;
      }
    }
    return expected<void, RemoteError>::success();
  }

  expected<InterpreterStatus, RemoteError> SetActiveInterpreter(
      const std::string&) override {
    ++calls;
    if (fail) return expected<InterpreterStatus, RemoteError>::error(fail_with);
    return expected<InterpreterStatus, RemoteError>::success(
        InterpreterStatus{true, false});
  }

  expected<InterpreterStatus, RemoteError> SetToDefaultInterpreter() override {
    ++calls;
    if (fail) return expected<InterpreterStatus, RemoteError>::error(fail_with);
    return expected<InterpreterStatus, RemoteError>::success(
        InterpreterStatus{false, false});
  }

  expected<void, RemoteError> SetPrivateAccessible(bool allow) override {
    private_access.store(allow ? 1 : 0);
    if (fail) return expected<void, RemoteError>::error(fail_with);
    return expected<void, RemoteError>::success();
  }
};

// ============================================================================
// RecordingInteractions - keeps every notification as a line of text
// ============================================================================

class RecordingInteractions final : public InteractionsListener {
 public:
  int32_t debug_port = -1;

  int32_t DebugPort() override { return debug_port; }
  void OnStdout(const std::string& text) override { Add("stdout:" + text); }
  void OnStderr(const std::string& text) override { Add("stderr:" + text); }
  std::string ConsoleInput() override { return "typed"; }
  void OnReturnedVoid() override { Add("void"); }
  void OnReturnedResult(const std::string& text, ResultStyle style) override {
    Add(std::string("result:") + ResultStyleName(style) + ":" + text);
  }
  void OnThrewException(const std::string& message) override {
    Add("exception:" + message);
  }
  void OnCalledExit(int32_t status) override {
    Add("exit:" + std::to_string(status));
  }
  void OnResetting() override { Add("resetting"); }
  void OnWontStart(const std::string& cause) override { Add("wontstart:" + cause); }
  void OnReady(const std::string&) override { Add("ready"); }

  std::vector<std::string> Events() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return events_;
  }

  size_t Count(const std::string& event) const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n = 0;
    for (const std::string& e : events_) {
      if (e == event) ++n;
    }
    return n;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    events_.clear();
  }

 private:
  void Add(const std::string& event) {
    std::lock_guard<std::mutex> lock(mtx_);
    events_.push_back(event);
  }

  mutable std::mutex mtx_;
  std::vector<std::string> events_;
};

class RecordingTestRun final : public TestRunListener {
 public:
  std::atomic<uint32_t> ready{0U};
  std::atomic<int32_t> suite_size{-1};
  std::vector<std::string> ended;
  size_t error_count = 0;

  void OnWorkerReady() override { ++ready; }
  void OnSuiteStarted(int32_t count) override { suite_size.store(count); }
  void OnTestEnded(const std::string& name, bool passed, bool) override {
    ended.push_back(name + (passed ? ":pass" : ":fail"));
  }
  void OnSuiteEnded(const std::vector<TestError>& errors) override {
    error_count = errors.size();
  }
  std::string FileForClass(const std::string& name) override {
    return "/src/" + name + ".java";
  }
};

/// @brief Poll @p pred for up to @p timeout.
template <typename Pred>
bool WaitUntil(Pred pred,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

}  // namespace isv_test

#endif  // ISV_TESTS_TEST_SUPPORT_HPP_
