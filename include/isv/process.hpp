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
 * @file process.hpp
 * @brief POSIX child process spawn, signal and wait.
 *
 * Spawn reports exec failures synchronously: the child writes the failing
 * stage and errno into a close-on-exec pipe, so the parent reads either
 * EOF (exec succeeded) or the failure record.
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef ISV_PROCESS_HPP_
#define ISV_PROCESS_HPP_

#include "isv/platform.hpp"
#include "isv/vocabulary.hpp"

#if defined(ISV_PLATFORM_POSIX)

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace isv {

enum class SpawnError : uint8_t {
  kInvalidArgs = 0,  ///< Empty argv
  kPipeFailed,
  kForkFailed,
  kChdirFailed,      ///< Working directory not usable
  kExecFailed        ///< Program missing or not executable
};

inline const char* SpawnErrorName(SpawnError err) noexcept {
  switch (err) {
    case SpawnError::kInvalidArgs: return "InvalidArgs";
    case SpawnError::kPipeFailed:  return "PipeFailed";
    case SpawnError::kForkFailed:  return "ForkFailed";
    case SpawnError::kChdirFailed: return "ChdirFailed";
    case SpawnError::kExecFailed:  return "ExecFailed";
    default:                       return "Unknown";
  }
}

/// @brief Spawn failure with the errno observed at the failing step.
struct SpawnFailure {
  SpawnError error;
  int sys_errno;
};

// ============================================================================
// PipeGuard - RAII wrapper for pipe file descriptors
// ============================================================================

namespace detail {

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Create a close-on-exec pipe. Returns false on failure.
  bool Create() {
#if defined(ISV_PLATFORM_LINUX)
    return pipe2(fd_, O_CLOEXEC) == 0;
#else
    if (pipe(fd_) != 0) return false;  // NOLINT
    return fcntl(fd_[0], F_SETFD, FD_CLOEXEC) == 0 &&
           fcntl(fd_[1], F_SETFD, FD_CLOEXEC) == 0;
#endif
  }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);
      fd_[0] = -1;
    }  // NOLINT
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);
      fd_[1] = -1;
    }  // NOLINT
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

/// Record sent through the exec-status pipe by a child that failed.
struct ExecStatusRecord {
  int32_t stage;  ///< SpawnError value
  int32_t sys_errno;
};

/// @brief async-signal-safe full write used between fork and exec.
inline void WriteAll(int fd, const void* data, size_t size) noexcept {
  const char* p = static_cast<const char*>(data);
  while (size > 0U) {
    ssize_t n = write(fd, p, size);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    p += n;
    size -= static_cast<size_t>(n);
  }
}

[[noreturn]] inline void ChildFail(int status_fd, SpawnError stage) noexcept {
  ExecStatusRecord rec{static_cast<int32_t>(stage), errno};
  WriteAll(status_fd, &rec, sizeof(rec));
  _exit(127);
}

}  // namespace detail

// ============================================================================
// WaitResult
// ============================================================================

struct WaitResult {
  bool exited;      ///< true if child exited normally
  int exit_code;    ///< Exit code (valid if exited==true)
  bool signaled;    ///< true if child was killed by signal
  int term_signal;  ///< Signal number (valid if signaled==true)

  WaitResult() : exited(false), exit_code(-1), signaled(false), term_signal(0) {}

  /// @brief Shell convention: exit code, or 128 + signal number.
  int Status() const noexcept {
    if (signaled) return 128 + term_signal;
    return exit_code;
  }
};

// ============================================================================
// Subprocess - spawned child process
// ============================================================================

/**
 * @brief Handle to one child process.
 *
 * RAII: destructor kills the child if it was never waited for.
 *
 * @code
 *   isv::Subprocess proc;
 *   auto r = proc.Start({"/bin/sh", "-c", "exit 3"}, "");
 *   if (r) { int status = proc.Wait().Status(); }  // 3
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() : pid_(-1) {}

  ~Subprocess() {
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      int status;
      waitpid(pid_, &status, 0);
    }
  }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) noexcept : pid_(other.pid_) { other.pid_ = -1; }

  /**
   * @brief Fork and exec @p argv[0] (PATH lookup) in @p working_dir.
   * @param argv        Program followed by its arguments.
   * @param working_dir Directory to chdir into; empty to inherit.
   * @return success once the exec has taken place, or the failing step.
   */
  expected<void, SpawnFailure> Start(const std::vector<std::string>& argv,
                                     const std::string& working_dir) {
    using Result = expected<void, SpawnFailure>;
    if (argv.empty() || argv[0].empty()) {
      return Result::error(SpawnFailure{SpawnError::kInvalidArgs, 0});
    }

    // Build the C argv before fork: no allocation in the child.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1U);
    for (const std::string& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const char* cwd = working_dir.empty() ? nullptr : working_dir.c_str();

    detail::PipeGuard status_pipe;
    if (!status_pipe.Create()) {
      return Result::error(SpawnFailure{SpawnError::kPipeFailed, errno});
    }

    pid_t child = fork();
    if (child < 0) {
      return Result::error(SpawnFailure{SpawnError::kForkFailed, errno});
    }

    if (child == 0) {
      // -- Child process --
      setsid();

      // Reset all signal dispositions to default (SIG_IGN survives exec)
      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // ignore errors for uncatchable
      }

      if (cwd != nullptr && chdir(cwd) != 0) {
        detail::ChildFail(status_pipe.WriteEnd(), SpawnError::kChdirFailed);
      }
      execvp(cargv[0], cargv.data());
      detail::ChildFail(status_pipe.WriteEnd(), SpawnError::kExecFailed);
    }

    // -- Parent process --
    status_pipe.CloseWrite();
    detail::ExecStatusRecord rec{};
    ssize_t n;
    do {
      n = read(status_pipe.ReadEnd(), &rec, sizeof(rec));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(rec))) {
      int status;
      waitpid(child, &status, 0);
      return Result::error(
          SpawnFailure{static_cast<SpawnError>(rec.stage), rec.sys_errno});
    }
    pid_ = child;
    return Result::success();
  }

  /**
   * @brief Block until the child has exited, without reaping it.
   *
   * The pid stays reserved until Wait(), so signals sent in between can
   * never reach an unrelated process.
   * @return false if the child is unknown or already reaped.
   */
  bool AwaitExit() const {
    if (pid_ <= 0) return false;
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int rc;
    do {
      rc = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
    } while (rc != 0 && errno == EINTR);
    return rc == 0;
  }

  /// @brief Blocking wait; reaps the child.
  WaitResult Wait() {
    WaitResult wr;
    if (pid_ <= 0) return wr;
    int status = 0;
    pid_t w;
    do {
      w = waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w > 0) {
      if (WIFEXITED(status)) {
        wr.exited = true;
        wr.exit_code = WEXITSTATUS(status);
      }
      if (WIFSIGNALED(status)) {
        wr.signaled = true;
        wr.term_signal = WTERMSIG(status);
      }
    }
    pid_ = -1;
    return wr;
  }

  /// @brief Send @p signo to the child. Returns false if not running.
  bool Signal(int signo) const {
    if (pid_ <= 0) return false;
    return kill(pid_, signo) == 0;
  }

  /// @brief Child PID (-1 if not started or already waited).
  pid_t GetPid() const { return pid_; }

 private:
  pid_t pid_;
};

}  // namespace isv

#endif  // ISV_PLATFORM_POSIX

#endif  // ISV_PROCESS_HPP_
