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
 * @file worker_remote.hpp
 * @brief RPC surface of a connected worker, as seen by the supervisor.
 *
 * The transport layer implements WorkerRemote on top of its own framing and
 * hands an instance to Supervisor::WorkerConnected(). Every call reports
 * transport problems through RemoteError; none of them throws.
 */

#ifndef ISV_WORKER_REMOTE_HPP_
#define ISV_WORKER_REMOTE_HPP_

#include "isv/vocabulary.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace isv {

// ============================================================================
// RemoteError
// ============================================================================

enum class RemoteError : uint8_t {
  kDisconnected = 0,  ///< Channel severed / end of stream: the worker went away
  kTransportFailure,  ///< Any other failure to complete the call
  kRejected           ///< Worker refused the request (e.g. duplicate name)
};

inline const char* RemoteErrorName(RemoteError err) noexcept {
  switch (err) {
    case RemoteError::kDisconnected:     return "Disconnected";
    case RemoteError::kTransportFailure: return "TransportFailure";
    case RemoteError::kRejected:         return "Rejected";
    default:                             return "Unknown";
  }
}

// ============================================================================
// InterpretOutcome - exactly one alternative per evaluation
// ============================================================================

struct NoValue {};
struct ObjectValue { std::string text; };
struct StringValue { std::string value; };
/// One character, UTF-8 encoded (one to four bytes).
struct CharValue { std::string value; };
struct NumberValue { std::variant<int64_t, double> value; };
struct BooleanValue { bool value; };
struct ExceptionValue { std::string message; };
/// Worker reported an unrecoverable internal fault.
struct UnexpectedFailure { std::string detail; };
/// Worker was still executing a previous call on the same handle.
struct Busy {};

using InterpretOutcome =
    std::variant<NoValue, ObjectValue, StringValue, CharValue, NumberValue,
                 BooleanValue, ExceptionValue, UnexpectedFailure, Busy>;

// ============================================================================
// Class path / named interpreter vocabulary
// ============================================================================

enum class ClassPathKind : uint8_t {
  kProject = 0,
  kBuildOutput,
  kProjectFiles,
  kExternalFiles,
  kExtra
};

/// Result of switching the active named interpreter.
struct InterpreterStatus {
  bool changed;  ///< Active interpreter differs from before the call
  bool busy;     ///< New active interpreter is executing something
};

// ============================================================================
// WorkerRemote
// ============================================================================

class WorkerRemote {
 public:
  virtual ~WorkerRemote() = default;

  virtual expected<InterpretOutcome, RemoteError> Interpret(
      const std::string& expression) = 0;

  virtual expected<std::string, RemoteError> GetVariableText(
      const std::string& name) = 0;
  virtual expected<std::string, RemoteError> GetVariableType(
      const std::string& name) = 0;

  virtual expected<void, RemoteError> AddClassPath(ClassPathKind kind,
                                                   const std::string& path) = 0;
  virtual expected<std::vector<std::string>, RemoteError> GetClassPath() = 0;

  virtual expected<std::vector<std::string>, RemoteError> FindTestClasses(
      const std::vector<std::string>& class_names,
      const std::vector<std::string>& files) = 0;
  /// @return false if no suite is cached in the worker.
  virtual expected<bool, RemoteError> RunTestSuite() = 0;

  virtual expected<void, RemoteError> AddInterpreter(const std::string& name) = 0;
  virtual expected<void, RemoteError> RemoveInterpreter(
      const std::string& name) = 0;
  virtual expected<InterpreterStatus, RemoteError> SetActiveInterpreter(
      const std::string& name) = 0;
  virtual expected<InterpreterStatus, RemoteError> SetToDefaultInterpreter() = 0;

  virtual expected<void, RemoteError> SetPrivateAccessible(bool allow) = 0;
};

/// Live reference to a connected worker. Valid while its owning state is
/// current; callers hold it for the duration of a single call only.
using WorkerHandle = std::shared_ptr<WorkerRemote>;

}  // namespace isv

#endif  // ISV_WORKER_REMOTE_HPP_
