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
 * @file listeners.hpp
 * @brief Host-side callback roles notified by the supervisor.
 *
 * Every method has a no-op default, so a host overrides only what it shows.
 * The supervisor calls listeners from whatever thread produced the event
 * (host thread, launcher monitor thread, transport thread); implementations
 * must be thread-safe.
 */

#ifndef ISV_LISTENERS_HPP_
#define ISV_LISTENERS_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace isv {

/// Rendering rule applied to a returned result.
enum class ResultStyle : uint8_t {
  kObject = 0,  ///< Natural textual form of an arbitrary value
  kString,      ///< Wrapped in double quotes
  kCharacter,   ///< Wrapped in single quotes
  kNumber       ///< Numeric literal
};

inline const char* ResultStyleName(ResultStyle style) noexcept {
  switch (style) {
    case ResultStyle::kObject:    return "object";
    case ResultStyle::kString:    return "string";
    case ResultStyle::kCharacter: return "character";
    case ResultStyle::kNumber:    return "number";
    default:                      return "unknown";
  }
}

/// One failed test reported at the end of a suite.
struct TestError {
  std::string test_name;
  std::string class_name;
  std::string message;
  std::string file;
  int32_t line;     ///< -1 when unknown
  bool is_error;    ///< true: error, false: assertion failure
};

/// A class file the worker could not load for testing.
struct ClassFileError {
  std::string class_name;
  std::string file;
  std::string reason;
};

// ============================================================================
// InteractionsListener
// ============================================================================

class InteractionsListener {
 public:
  virtual ~InteractionsListener() = default;

  /// @return Port a debugger may attach on, or -1 when none is available.
  virtual int32_t DebugPort() { return -1; }

  virtual void OnStdout(const std::string& text) { (void)text; }
  virtual void OnStderr(const std::string& text) { (void)text; }
  /// Blocks the worker until the host supplies a line of input.
  virtual std::string ConsoleInput() { return std::string(); }

  virtual void OnReturnedVoid() {}
  virtual void OnReturnedResult(const std::string& text, ResultStyle style) {
    (void)text;
    (void)style;
  }
  virtual void OnThrewException(const std::string& message) { (void)message; }

  /// Evaluated code terminated the worker with @p status.
  virtual void OnCalledExit(int32_t status) { (void)status; }
  virtual void OnResetting() {}
  /// Startup was abandoned after repeated failures.
  virtual void OnWontStart(const std::string& cause) { (void)cause; }
  /// A worker is connected and idle; @p working_dir is where it runs.
  virtual void OnReady(const std::string& working_dir) { (void)working_dir; }
};

// ============================================================================
// TestRunListener
// ============================================================================

class TestRunListener {
 public:
  virtual ~TestRunListener() = default;

  virtual void OnNonTestCase(bool run_all) { (void)run_all; }
  virtual void OnClassFileError(const ClassFileError& error) { (void)error; }
  virtual void OnSuiteStarted(int32_t test_count) { (void)test_count; }
  virtual void OnTestStarted(const std::string& name) { (void)name; }
  virtual void OnTestEnded(const std::string& name, bool passed,
                           bool was_error) {
    (void)name;
    (void)passed;
    (void)was_error;
  }
  virtual void OnSuiteEnded(const std::vector<TestError>& errors) {
    (void)errors;
  }
  /// @return Source file declaring @p class_name, empty if unknown.
  virtual std::string FileForClass(const std::string& class_name) {
    (void)class_name;
    return std::string();
  }
  virtual void OnWorkerReady() {}
};

// ============================================================================
// DebugListener
// ============================================================================

class DebugListener {
 public:
  virtual ~DebugListener() = default;

  /// The worker assigned interpreter @p name to the debugger.
  virtual void OnDebugInterpreterAssigned(const std::string& name) {
    (void)name;
  }
};

}  // namespace isv

#endif  // ISV_LISTENERS_HPP_
