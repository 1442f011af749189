/**
 * @file test_supervisor.cpp
 * @brief Supervisor behaviour against a fake launcher and fake workers.
 */

#include "isv/supervisor.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using isv::LifecycleKind;
using isv::Supervisor;
using isv::SupervisorError;
using isv_test::FakeLauncher;
using isv_test::FakeWorker;
using isv_test::RecordingInteractions;
using isv_test::RecordingTestRun;

namespace {

isv::SupervisorOptions FastOptions() {
  isv::SupervisorOptions opt;
  opt.worker_program = "worker";
  opt.startup_timeout_ms = 200U;
  return opt;
}

/// Start and connect a worker; returns the fake behind the handle.
std::shared_ptr<FakeWorker> Connect(Supervisor& sup) {
  REQUIRE(sup.Start().has_value());
  auto w = std::make_shared<FakeWorker>();
  sup.WorkerConnected(w);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFreshRunning);
  return w;
}

}  // namespace

// ============================================================================
// Lifecycle through the public surface
// ============================================================================

TEST_CASE("Supervisor starts in Fresh and does nothing until asked",
          "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFresh);
  REQUIRE(launcher.SpawnCount() == 0U);
}

TEST_CASE("Supervisor concurrent Start issues exactly one spawn", "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&]() { (void)sup.Start(); });
  }
  for (auto& t : threads) t.join();
  REQUIRE(launcher.SpawnCount() == 1U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kStarting);
}

TEST_CASE("Supervisor Stop without a worker is a no-op", "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  REQUIRE(sup.Stop().has_value());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFresh);
  REQUIRE(launcher.QuitCount() == 0U);
}

TEST_CASE("Supervisor connect announces readiness to both listeners",
          "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  RecordingTestRun tests;
  sup.SetInteractionsListener(&console);
  sup.SetTestRunListener(&tests);
  Connect(sup);
  REQUIRE(console.Count("ready") == 1U);
  REQUIRE(tests.ready.load() == 1U);
}

TEST_CASE("Supervisor applies the private-access flag to a new worker",
          "[supervisor]") {
  FakeLauncher launcher;
  auto opt = FastOptions();
  opt.allow_private_access = true;
  Supervisor sup(launcher, opt);
  auto w = Connect(sup);
  REQUIRE(w->private_access.load() == 1);
}

TEST_CASE("Supervisor startup failures retry up to the bound, then give up",
          "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);

  REQUIRE(sup.Start().has_value());
  REQUIRE(launcher.SpawnCount() == 1U);
  sup.WorkerFailedToStart("handshake refused");
  REQUIRE(launcher.SpawnCount() == 2U);
  sup.WorkerFailedToStart("handshake refused");
  REQUIRE(launcher.SpawnCount() == 3U);
  REQUIRE(console.Count("wontstart:handshake refused") == 0U);
  sup.WorkerFailedToStart("handshake refused");

  REQUIRE(launcher.SpawnCount() == 3U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFresh);
  REQUIRE(console.Count("wontstart:handshake refused") == 1U);
  // The last attempt's process is dropped along with the attempt.
  REQUIRE(launcher.DiscardCount() == 1U);
}

TEST_CASE("Supervisor synchronous spawn failures also stop at the bound",
          "[supervisor]") {
  FakeLauncher launcher;
  launcher.SetFailSpawn(true);
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);

  REQUIRE(sup.Start().has_value());
  REQUIRE(launcher.SpawnCount() == 3U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFresh);
  REQUIRE(console.Count("wontstart:no such program") == 1U);
}

TEST_CASE("Supervisor Restart without force keeps an unused worker",
          "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  Connect(sup);
  console.Clear();

  REQUIRE(sup.Restart(false).has_value());
  REQUIRE(launcher.QuitCount() == 0U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFreshRunning);
  REQUIRE(console.Events() == std::vector<std::string>{"ready"});
}

TEST_CASE("Supervisor Restart with force replaces an unused worker",
          "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  Connect(sup);

  REQUIRE(sup.Restart(true).has_value());
  REQUIRE(launcher.QuitCount() == 1U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kRestarting);
  REQUIRE(console.Count("resetting") == 1U);
  REQUIRE(console.Count("ready") == 2U);

  sup.WorkerQuit(143);
  REQUIRE(launcher.SpawnCount() == 2U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kStarting);
  // A requested restart is not an unsolicited exit.
  REQUIRE(console.Count("exit:143") == 0U);
}

TEST_CASE("Supervisor quit while stopping does not respawn", "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  Connect(sup);
  REQUIRE(sup.Stop().has_value());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kStopping);
  sup.WorkerQuit(0);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFresh);
  REQUIRE(launcher.SpawnCount() == 1U);
}

TEST_CASE("Supervisor unsolicited quit reports exit, resets and respawns once",
          "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  auto w = Connect(sup);
  REQUIRE(sup.Interpret("System.exit(143)").has_value());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kRunning);
  console.Clear();

  sup.WorkerQuit(143);
  REQUIRE(console.Events() == std::vector<std::string>{"exit:143", "resetting"});
  REQUIRE(launcher.SpawnCount() == 2U);
  REQUIRE(sup.CurrentKind() == LifecycleKind::kStarting);
}

TEST_CASE("Supervisor Dispose is idempotent and final", "[supervisor]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  Connect(sup);
  REQUIRE(sup.Dispose().has_value());
  REQUIRE(sup.Dispose().has_value());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kDisposed);
  REQUIRE(launcher.ShutdownCount() >= 1U);

  REQUIRE(sup.Start().get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.Stop().get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.Restart(true).get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.Interpret("1").get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.GetVariableText("x").get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.GetClassPath().get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.AddInterpreter("a").get_error() == SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.SetToDefaultInterpreter().get_error() ==
          SupervisorError::kAlreadyDisposed);
  REQUIRE(sup.RunTestSuite().get_error() == SupervisorError::kAlreadyDisposed);
}

// ============================================================================
// Interpret and result dispatch
// ============================================================================

TEST_CASE("Supervisor evaluates and demotes the fresh worker", "[supervisor][interpret]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  auto w = Connect(sup);
  w->next_outcome = isv::NumberValue{int64_t{4}};
  console.Clear();

  auto r = sup.Interpret("2+2");
  REQUIRE(r.has_value());
  REQUIRE(r.value());
  REQUIRE(w->interpreted == std::vector<std::string>{"2+2"});
  REQUIRE(console.Events() == std::vector<std::string>{"result:number:4"});
  REQUIRE(sup.CurrentKind() == LifecycleKind::kRunning);
}

TEST_CASE("Supervisor Interpret without a worker returns false", "[supervisor][interpret]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto r = sup.Interpret("1");
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value());
}

TEST_CASE("Supervisor Interpret while starting times out to false",
          "[supervisor][interpret]") {
  FakeLauncher launcher;
  auto opt = FastOptions();
  opt.startup_timeout_ms = 30U;
  Supervisor sup(launcher, opt);
  REQUIRE(sup.Start().has_value());
  auto r = sup.Interpret("1");
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value());
}

TEST_CASE("Supervisor reports a busy worker after notifying void",
          "[supervisor][interpret]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  auto w = Connect(sup);
  w->next_outcome = isv::Busy{};
  console.Clear();

  auto r = sup.Interpret("x");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == SupervisorError::kWorkerBusy);
  REQUIRE(console.Events() == std::vector<std::string>{"void"});
}

TEST_CASE("Supervisor reports a worker fault after notifying void",
          "[supervisor][interpret]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  auto w = Connect(sup);
  w->next_outcome = isv::UnexpectedFailure{"NullPointerException in worker"};
  console.Clear();

  auto r = sup.Interpret("x");
  REQUIRE(r.get_error() == SupervisorError::kWorkerFault);
  REQUIRE(console.Events() == std::vector<std::string>{"void"});
}

// ============================================================================
// Transport failures
// ============================================================================

TEST_CASE("Supervisor swallows a disconnect silently", "[supervisor][transport]") {
  isv::ResetDiagnosticCounts();
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);
  w->fail = true;
  w->fail_with = isv::RemoteError::kDisconnected;

  auto r = sup.GetVariableText("x");
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value().has_value());
  REQUIRE(isv::DiagnosticCount(isv::DiagnosticCode::kTransportFailure) == 0U);
}

TEST_CASE("Supervisor records other transport failures", "[supervisor][transport]") {
  isv::ResetDiagnosticCounts();
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);
  w->fail = true;

  auto r = sup.AddClassPath(isv::ClassPathKind::kExtra, "/lib/x.jar");
  REQUIRE(r.has_value());
  REQUIRE_FALSE(r.value());
  REQUIRE(isv::DiagnosticCount(isv::DiagnosticCode::kTransportFailure) == 1U);
}

TEST_CASE("Supervisor forwards diagnostics to an installed reporter",
          "[supervisor][transport]") {
  struct Seen {
    std::atomic<int> count{0};
  } seen;
  isv::SetDiagnosticReporter(
      {[](isv::DiagnosticCode code, const char*, void* ctx) {
         if (code == isv::DiagnosticCode::kTransportFailure) {
           static_cast<Seen*>(ctx)->count.fetch_add(1);
         }
       },
       &seen});
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);
  w->fail = true;
  (void)sup.GetVariableType("x");
  isv::SetDiagnosticReporter({});
  REQUIRE(seen.count.load() == 1);
}

// ============================================================================
// RPC delegation
// ============================================================================

TEST_CASE("Supervisor status queries do not demote the worker", "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);

  REQUIRE(sup.GetVariableText("x").value().value() == "text of x");
  REQUIRE(sup.GetVariableType("x").value().value() == "type of x");
  REQUIRE(sup.AddClassPath(isv::ClassPathKind::kProject, "/a").value());
  REQUIRE(sup.RemoveInterpreter("none").value());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFreshRunning);
}

TEST_CASE("Supervisor GetClassPath keeps order and drops duplicates",
          "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);
  w->class_path = {"/b", "/a", "/b", "/c", "/a"};

  auto r = sup.GetClassPath();
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
  REQUIRE(*r.value() == std::vector<std::string>{"/b", "/a", "/c"});
}

TEST_CASE("Supervisor SetPackageScope sends a package statement", "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  auto w = Connect(sup);
  console.Clear();

  REQUIRE(sup.SetPackageScope("org.example").value());
  REQUIRE(w->interpreted == std::vector<std::string>{"package org.example;"});
  REQUIRE(console.Events().empty());
}

TEST_CASE("Supervisor AddInterpreter rejects duplicate names", "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);
  REQUIRE(sup.AddInterpreter("debug-1").value());
  auto r = sup.AddInterpreter("debug-1");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == SupervisorError::kDuplicateName);
}

TEST_CASE("Supervisor interpreter switching reports changed and busy",
          "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  Connect(sup);
  auto active = sup.SetActiveInterpreter("debug-1");
  REQUIRE(active.value().has_value());
  REQUIRE(active.value()->changed);
  REQUIRE_FALSE(active.value()->busy);
  auto def = sup.SetToDefaultInterpreter();
  REQUIRE(def.value().has_value());
  REQUIRE_FALSE(def.value()->changed);
}

TEST_CASE("Supervisor test discovery and run", "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  Connect(sup);
  auto found = sup.FindTestClasses({"FooTest", "Foo", "BarTest"}, {"/src/Foo.java"});
  REQUIRE(*found.value() == std::vector<std::string>{"FooTest", "BarTest"});
  REQUIRE(sup.CurrentKind() == LifecycleKind::kFreshRunning);
  REQUIRE(sup.RunTestSuite().value());
  REQUIRE(sup.CurrentKind() == LifecycleKind::kRunning);
}

TEST_CASE("Supervisor SetPrivateAccessible updates the live worker and future ones",
          "[supervisor][rpc]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  auto w = Connect(sup);
  REQUIRE(w->private_access.load() == 0);
  REQUIRE(sup.SetPrivateAccessible(true).value());
  REQUIRE(w->private_access.load() == 1);
  REQUIRE(sup.Options().allow_private_access);
}

// ============================================================================
// Launch settings
// ============================================================================

TEST_CASE("Supervisor setters shape the next spawn request", "[supervisor][launch]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  console.debug_port = 8000;
  sup.SetInteractionsListener(&console);
  sup.SetAllowAssertions(true);
  sup.SetHeapSizeMb(256U);
  sup.SetExtraArguments("-Dx=1 'y z'");
  sup.SetStartupClassPath(std::string("/a.jar") + isv::kPathListSeparator + "/b.jar");
  sup.SetWorkingDirectory("/tmp");

  REQUIRE(sup.Start().has_value());
  isv::LaunchSpec spec = launcher.LastSpec();
  REQUIRE(spec.program == "worker");
  REQUIRE(spec.working_dir == "/tmp");
  REQUIRE(spec.class_path == std::vector<std::string>{"/a.jar", "/b.jar"});
  REQUIRE(spec.arguments.front() == "-ea");
  REQUIRE(spec.arguments[1] ==
          "-agentlib:jdwp=transport=dt_socket,server=y,suspend=n,address=8000");
  REQUIRE(spec.arguments[spec.arguments.size() - 2U] == "-Dx=1");
  REQUIRE(spec.arguments.back() == "y z");
}

// ============================================================================
// Worker callbacks and listeners
// ============================================================================

TEST_CASE("Supervisor forwards worker callbacks to the current listeners",
          "[supervisor][callbacks]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  RecordingTestRun tests;
  sup.SetInteractionsListener(&console);
  sup.SetTestRunListener(&tests);

  sup.PrintStdout("out");
  sup.PrintStderr("err");
  REQUIRE(sup.ConsoleInput() == "typed");
  sup.TestSuiteStarted(2);
  sup.TestEnded("testA", true, false);
  sup.TestEnded("testB", false, true);
  sup.TestSuiteEnded({isv::TestError{"testB", "FooTest", "boom", "", -1, true}});

  REQUIRE(console.Events() == std::vector<std::string>{"stdout:out", "stderr:err"});
  REQUIRE(tests.suite_size.load() == 2);
  REQUIRE(tests.ended == std::vector<std::string>{"testA:pass", "testB:fail"});
  REQUIRE(tests.error_count == 1U);
  REQUIRE(sup.FileForClassName("Foo") == "/src/Foo.java");
}

TEST_CASE("Supervisor falls back to no-op listeners", "[supervisor][callbacks]") {
  FakeLauncher launcher;
  Supervisor sup(launcher, FastOptions());
  RecordingInteractions console;
  sup.SetInteractionsListener(&console);
  sup.SetInteractionsListener(nullptr);
  sup.PrintStdout("dropped");
  REQUIRE(sup.ConsoleInput().empty());
  REQUIRE(sup.FileForClassName("Foo").empty());
  sup.DebugInterpreterAssigned("debug-1");
  REQUIRE(console.Events().empty());
}

TEST_CASE("Supervisor destructor shuts the launcher down", "[supervisor]") {
  FakeLauncher launcher;
  {
    Supervisor sup(launcher, FastOptions());
    Connect(sup);
  }
  REQUIRE(launcher.QuitCount() == 1U);
  REQUIRE(launcher.ShutdownCount() >= 1U);
}
