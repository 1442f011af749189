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
 * @file result_dispatcher.hpp
 * @brief Maps one InterpretOutcome to exactly one listener notification.
 */

#ifndef ISV_RESULT_DISPATCHER_HPP_
#define ISV_RESULT_DISPATCHER_HPP_

#include "isv/listeners.hpp"
#include "isv/vocabulary.hpp"
#include "isv/worker_remote.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <variant>

namespace isv {

// ============================================================================
// Overloaded visitor pattern (C++17)
// ============================================================================

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

enum class DispatchError : uint8_t {
  kWorkerBusy = 0,  ///< Call issued while the previous one was running
  kWorkerFault      ///< Worker reported an unrecoverable internal fault
};

/**
 * @brief Natural text of a numeric result.
 *
 * Integers print as-is. Floating values use the fewest significant digits
 * (15, 16 or 17) that read back to the same double, and always carry a
 * fraction or exponent ("4.0", "0.30000000000000004", "1e+20").
 */
inline std::string RenderNumber(const NumberValue& number) {
  if (const int64_t* i = std::get_if<int64_t>(&number.value)) {
    return std::to_string(*i);
  }
  const double d = std::get<double>(number.value);
  char buf[40];
  for (int precision = 15; precision <= 17; ++precision) {
    (void)std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (std::strtod(buf, nullptr) == d) break;
  }
  if (std::strpbrk(buf, ".eEn") == nullptr) {  // "n": nan / inf
    std::strncat(buf, ".0", sizeof(buf) - std::strlen(buf) - 1U);
  }
  return std::string(buf);
}

class ResultDispatcher final {
 public:
  /**
   * @brief Notify @p listener about @p outcome.
   *
   * Busy and UnexpectedFailure first notify OnReturnedVoid() so the host
   * never waits forever for a result, then report the condition to the
   * caller.
   */
  static expected<void, DispatchError> Dispatch(const InterpretOutcome& outcome,
                                                InteractionsListener& listener) {
    using Result = expected<void, DispatchError>;
    return std::visit(
        overloaded{
            [&](const NoValue&) {
              listener.OnReturnedVoid();
              return Result::success();
            },
            [&](const ObjectValue& v) {
              listener.OnReturnedResult(v.text, ResultStyle::kObject);
              return Result::success();
            },
            [&](const StringValue& v) {
              listener.OnReturnedResult("\"" + v.value + "\"",
                                        ResultStyle::kString);
              return Result::success();
            },
            [&](const CharValue& v) {
              const std::string text = "'" + v.value + "'";
              listener.OnReturnedResult(text, ResultStyle::kCharacter);
              return Result::success();
            },
            [&](const NumberValue& v) {
              listener.OnReturnedResult(RenderNumber(v), ResultStyle::kNumber);
              return Result::success();
            },
            [&](const BooleanValue& v) {
              listener.OnReturnedResult(v.value ? "true" : "false",
                                        ResultStyle::kObject);
              return Result::success();
            },
            [&](const ExceptionValue& v) {
              listener.OnThrewException(v.message);
              return Result::success();
            },
            [&](const UnexpectedFailure&) {
              listener.OnReturnedVoid();
              return Result::error(DispatchError::kWorkerFault);
            },
            [&](const Busy&) {
              listener.OnReturnedVoid();
              return Result::error(DispatchError::kWorkerBusy);
            }},
        outcome);
  }
};

}  // namespace isv

#endif  // ISV_RESULT_DISPATCHER_HPP_
