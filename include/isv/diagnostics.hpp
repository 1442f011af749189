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
 * @file diagnostics.hpp
 * @brief Process-wide diagnostic sink for failures that are converted to
 *        neutral results instead of being returned to a caller.
 *
 * Every RecordDiagnostic() call is logged at ERROR and counted per code. An
 * application may additionally wire a DiagnosticReporter (fn + ctx, same
 * shape as a fault reporter injection point) to forward records into its
 * own error-reporting facility.
 *
 * Usage:
 * @code
 *   isv::SetDiagnosticReporter({[](isv::DiagnosticCode code,
 *                                  const char* detail, void* ctx) {
 *     static_cast<MyErrorLog*>(ctx)->Add(code, detail);
 *   }, &error_log});
 * @endcode
 */

#ifndef ISV_DIAGNOSTICS_HPP_
#define ISV_DIAGNOSTICS_HPP_

#include "isv/log.hpp"
#include "isv/platform.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>

namespace isv {

// ============================================================================
// DiagnosticCode
// ============================================================================

enum class DiagnosticCode : uint8_t {
  kTransportFailure = 0U,  ///< RPC call failed for a reason other than worker exit
  kStateTimeout,           ///< Lifecycle wait expired where it must not
  kUnexpectedEvent,        ///< Worker event arrived in a state that cannot take it
  kLaunchFailure,          ///< Process layer could not hand out a worker
  kCount
};

inline const char* DiagnosticCodeName(DiagnosticCode code) noexcept {
  switch (code) {
    case DiagnosticCode::kTransportFailure: return "TransportFailure";
    case DiagnosticCode::kStateTimeout:     return "StateTimeout";
    case DiagnosticCode::kUnexpectedEvent:  return "UnexpectedEvent";
    case DiagnosticCode::kLaunchFailure:    return "LaunchFailure";
    default:                                return "Unknown";
  }
}

// ============================================================================
// DiagnosticReporter
// ============================================================================

using DiagnosticReportFn = void (*)(DiagnosticCode code, const char* detail,
                                    void* ctx);

struct DiagnosticReporter {
  DiagnosticReportFn fn = nullptr;  ///< nullptr = log only
  void* ctx = nullptr;
};

namespace detail {

struct DiagnosticRegistry {
  std::mutex mtx;
  DiagnosticReporter reporter;
  std::array<std::atomic<uint64_t>,
             static_cast<size_t>(DiagnosticCode::kCount)> counts{};
};

inline DiagnosticRegistry& Diagnostics() noexcept {
  static DiagnosticRegistry registry;
  return registry;
}

}  // namespace detail

/// @brief Install the process-wide reporter ({nullptr, nullptr} detaches).
inline void SetDiagnosticReporter(DiagnosticReporter reporter) noexcept {
  auto& reg = detail::Diagnostics();
  std::lock_guard<std::mutex> lk(reg.mtx);
  reg.reporter = reporter;
}

/**
 * @brief Record a swallowed failure.
 * @param code   Failure class.
 * @param what   Human-readable detail (copied by the reporter if kept).
 */
inline void RecordDiagnostic(DiagnosticCode code, const char* what) noexcept {
  auto& reg = detail::Diagnostics();
  reg.counts[static_cast<size_t>(code)].fetch_add(1U, std::memory_order_relaxed);
  ISV_LOG_ERROR("Diagnostics", "%s: %s", DiagnosticCodeName(code),
                what != nullptr ? what : "");
  DiagnosticReporter reporter;
  {
    std::lock_guard<std::mutex> lk(reg.mtx);
    reporter = reg.reporter;
  }
  if (reporter.fn != nullptr) {
    reporter.fn(code, what != nullptr ? what : "", reporter.ctx);
  }
}

/// @brief Number of records for @p code since start (or the last reset).
inline uint64_t DiagnosticCount(DiagnosticCode code) noexcept {
  return detail::Diagnostics().counts[static_cast<size_t>(code)].load(
      std::memory_order_relaxed);
}

inline void ResetDiagnosticCounts() noexcept {
  for (auto& c : detail::Diagnostics().counts) {
    c.store(0U, std::memory_order_relaxed);
  }
}

}  // namespace isv

#endif  // ISV_DIAGNOSTICS_HPP_
