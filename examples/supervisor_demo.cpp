/**
 * @file supervisor_demo.cpp
 * @brief Drive a Supervisor against an in-process loopback worker.
 *
 * Demonstrates:
 *   - Implementing WorkerLauncher / WorkerRemote for a custom transport
 *   - Receiving results through an InteractionsListener
 *   - Restarting the worker and disposing the supervisor
 *   - Loading SupervisorOptions from an INI/JSON/YAML file (argv[1])
 *
 * Usage: supervisor_demo [config-file]
 */

#include "isv/config.hpp"
#include "isv/log.hpp"
#include "isv/supervisor.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

// -- Loopback worker ---------------------------------------------------------

/// Evaluates literals only: 42, 2.5, "text", 'c', true/false, throw <msg>.
class LoopbackWorker final : public isv::WorkerRemote {
 public:
  isv::expected<isv::InterpretOutcome, isv::RemoteError> Interpret(
      const std::string& expression) override {
    using Result = isv::expected<isv::InterpretOutcome, isv::RemoteError>;
    const std::string e = Trim(expression);
    if (e.empty() || e.back() == ';') return Result::success(isv::NoValue{});
    if (e == "true" || e == "false") {
      return Result::success(isv::BooleanValue{e == "true"});
    }
    if (e.size() >= 2U && e.front() == '"' && e.back() == '"') {
      return Result::success(isv::StringValue{e.substr(1U, e.size() - 2U)});
    }
    if (e.size() == 3U && e.front() == '\'' && e.back() == '\'') {
      return Result::success(isv::CharValue{std::string(1U, e[1])});
    }
    if (e.compare(0U, 6U, "throw ") == 0) {
      return Result::success(isv::ExceptionValue{e.substr(6U)});
    }
    char* end = nullptr;
    const long long i = std::strtoll(e.c_str(), &end, 10);
    if (end != nullptr && *end == '\0') {
      return Result::success(isv::NumberValue{static_cast<int64_t>(i)});
    }
    const double d = std::strtod(e.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      return Result::success(isv::NumberValue{d});
    }
    return Result::success(isv::ObjectValue{"<" + e + ">"});
  }

  isv::expected<std::string, isv::RemoteError> GetVariableText(
      const std::string& name) override {
    return isv::expected<std::string, isv::RemoteError>::success(name);
  }
  isv::expected<std::string, isv::RemoteError> GetVariableType(
      const std::string&) override {
    return isv::expected<std::string, isv::RemoteError>::success("Object");
  }

  isv::expected<void, isv::RemoteError> AddClassPath(isv::ClassPathKind,
                                                     const std::string& path) override {
    class_path_.push_back(path);
    return isv::expected<void, isv::RemoteError>::success();
  }
  isv::expected<std::vector<std::string>, isv::RemoteError> GetClassPath() override {
    return isv::expected<std::vector<std::string>, isv::RemoteError>::success(
        class_path_);
  }

  isv::expected<std::vector<std::string>, isv::RemoteError> FindTestClasses(
      const std::vector<std::string>&, const std::vector<std::string>&) override {
    return isv::expected<std::vector<std::string>, isv::RemoteError>::success({});
  }
  isv::expected<bool, isv::RemoteError> RunTestSuite() override {
    return isv::expected<bool, isv::RemoteError>::success(false);
  }

  isv::expected<void, isv::RemoteError> AddInterpreter(const std::string&) override {
    return isv::expected<void, isv::RemoteError>::success();
  }
  isv::expected<void, isv::RemoteError> RemoveInterpreter(const std::string&) override {
    return isv::expected<void, isv::RemoteError>::success();
  }
  isv::expected<isv::InterpreterStatus, isv::RemoteError> SetActiveInterpreter(
      const std::string&) override {
    return isv::expected<isv::InterpreterStatus, isv::RemoteError>::success(
        isv::InterpreterStatus{true, false});
  }
  isv::expected<isv::InterpreterStatus, isv::RemoteError> SetToDefaultInterpreter()
      override {
    return isv::expected<isv::InterpreterStatus, isv::RemoteError>::success(
        isv::InterpreterStatus{true, false});
  }

  isv::expected<void, isv::RemoteError> SetPrivateAccessible(bool) override {
    return isv::expected<void, isv::RemoteError>::success();
  }

 private:
  static std::string Trim(const std::string& s) {
    size_t b = 0U;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1U])) != 0) --e;
    return s.substr(b, e - b);
  }

  std::vector<std::string> class_path_;
};

// -- Loopback launcher -------------------------------------------------------

/// "Spawns" a LoopbackWorker and reports its events from a helper thread.
class LoopbackLauncher final : public isv::WorkerLauncher {
 public:
  ~LoopbackLauncher() override { Shutdown(); }

  isv::expected<void, isv::LaunchFailure> Spawn(const isv::LaunchSpec& spec,
                                                isv::WorkerEventSink& sink) override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shut_down_) {
      return isv::expected<void, isv::LaunchFailure>::error(
          isv::LaunchFailure{isv::LaunchError::kShutDown, "launcher shut down"});
    }
    ISV_LOG_INFO("demo", "spawn %s (%zu args)", spec.program.c_str(),
                 spec.arguments.size());
    sink_ = &sink;
    isv::WorkerHandle worker = std::make_shared<LoopbackWorker>();
    threads_.emplace_back([&sink, worker] { sink.WorkerConnected(worker); });
    return isv::expected<void, isv::LaunchFailure>::success();
  }

  void RequestQuit() override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (sink_ == nullptr) return;
    isv::WorkerEventSink* sink = sink_;
    sink_ = nullptr;
    threads_.emplace_back([sink] { sink->WorkerQuit(0); });
  }

  void Discard() override {
    std::lock_guard<std::mutex> lock(mtx_);
    sink_ = nullptr;
  }

  void Shutdown() override {
    std::vector<std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      shut_down_ = true;
      sink_ = nullptr;
      threads.swap(threads_);
    }
    for (std::thread& t : threads) {
      if (t.get_id() == std::this_thread::get_id()) {
        t.detach();
      } else if (t.joinable()) {
        t.join();
      }
    }
  }

 private:
  std::mutex mtx_;
  isv::WorkerEventSink* sink_ = nullptr;
  bool shut_down_ = false;
  std::vector<std::thread> threads_;
};

// -- Console listener --------------------------------------------------------

class ConsoleListener final : public isv::InteractionsListener {
 public:
  void OnReturnedVoid() override { std::printf("  => (void)\n"); }
  void OnReturnedResult(const std::string& text, isv::ResultStyle style) override {
    std::printf("  => %s [%s]\n", text.c_str(), isv::ResultStyleName(style));
  }
  void OnThrewException(const std::string& message) override {
    std::printf("  !! %s\n", message.c_str());
  }
  void OnResetting() override { std::printf("  -- resetting\n"); }
  void OnReady(const std::string& working_dir) override {
    std::printf("  -- ready in %s\n", working_dir.c_str());
  }
  void OnWontStart(const std::string& cause) override {
    std::printf("  -- worker won't start: %s\n", cause.c_str());
  }
};

#if defined(ISV_CONFIG_INI_ENABLED) || defined(ISV_CONFIG_JSON_ENABLED) || \
    defined(ISV_CONFIG_YAML_ENABLED)
bool LoadOptions(const char* path, isv::SupervisorOptions& out) {
  isv::MultiConfig cfg;
  auto r = cfg.LoadFile(path);
  if (!r) {
    ISV_LOG_ERROR("demo", "cannot load %s", path);
    return false;
  }
  out = isv::LoadSupervisorOptions(cfg);
  return true;
}
#endif

}  // namespace

int main(int argc, char* argv[]) {
  isv::log::Init();
  isv::log::SetLevel(isv::log::Level::kInfo);

  isv::SupervisorOptions options;
  options.worker_program = "loopback";
  if (argc > 1) {
#if defined(ISV_CONFIG_INI_ENABLED) || defined(ISV_CONFIG_JSON_ENABLED) || \
    defined(ISV_CONFIG_YAML_ENABLED)
    if (!LoadOptions(argv[1], options)) return 1;
#else
    ISV_LOG_WARN("demo", "no config backend built in, ignoring %s", argv[1]);
#endif
  }

  LoopbackLauncher launcher;
  ConsoleListener console;
  {
    isv::Supervisor supervisor(launcher, options);
    supervisor.SetInteractionsListener(&console);

    if (!supervisor.Start()) {
      ISV_LOG_ERROR("demo", "start failed");
      return 1;
    }

    const char* inputs[] = {"42", "2.0", "\"hello\"", "'x'", "true",
                            "int y = 1;", "throw boom", "new Object()"};
    for (const char* input : inputs) {
      std::printf("> %s\n", input);
      auto r = supervisor.Interpret(input);
      if (!r) {
        std::printf("  error: %s\n", isv::SupervisorErrorName(r.get_error()));
      }
    }

    std::printf("> (restart)\n");
    (void)supervisor.Restart(false);
    (void)supervisor.Interpret("7");

    (void)supervisor.Dispose();
    std::printf("final state: %s\n",
                isv::LifecycleKindName(supervisor.CurrentKind()));
  }

  isv::log::Shutdown();
  return 0;
}
