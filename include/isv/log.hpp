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
 * @file log.hpp
 * @brief Synchronous printf-style logging with runtime and compile-time
 *        level filtering.
 *
 * Output format (one line per call):
 *   2026-01-01 12:00:00.123 [WARN ] [Supervisor] message (supervisor.hpp:42)
 *
 * Lines go to stderr unless a sink is installed with SetSink(). Each line is
 * formatted on the caller's stack and emitted with a single write, so lines
 * from concurrent threads never interleave.
 *
 * Compile-time configuration:
 *   ISV_LOG_MIN_LEVEL -- 0=DEBUG .. 4=FATAL; calls below it compile away.
 */

#ifndef ISV_LOG_HPP_
#define ISV_LOG_HPP_

#include "isv/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#if defined(ISV_PLATFORM_POSIX)
#include <time.h>
#endif

#ifndef ISV_LOG_MIN_LEVEL
#define ISV_LOG_MIN_LEVEL 0
#endif

namespace isv {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

/**
 * @brief Sink signature for formatted log lines.
 * @param level   Severity of the line.
 * @param line    NUL-terminated formatted line (no trailing newline).
 * @param context User context given to SetSink().
 */
using LogSinkFn = void (*)(Level level, const char* line, void* context);

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

struct SinkSlot {
  std::mutex mtx;
  LogSinkFn fn = nullptr;
  void* context = nullptr;
};

inline SinkSlot& Sink() noexcept {
  static SinkSlot slot;
  return slot;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO ";
    case Level::kWarn:  return "WARN ";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?????";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the current wall clock as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(ISV_PLATFORM_POSIX)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_buf;
  localtime_r(&ts.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, bufsz, "%Y-%m-%d %H:%M:%S", &tm_buf);
  (void)std::snprintf(buf + n, bufsz - n, ".%03ld", ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  (void)std::strftime(buf, bufsz, "%Y-%m-%d %H:%M:%S.000", std::localtime(&t));
#endif
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// @brief Flush stderr and detach any installed sink.
inline void Shutdown() noexcept {
  {
    std::lock_guard<std::mutex> lk(detail::Sink().mtx);
    detail::Sink().fn = nullptr;
    detail::Sink().context = nullptr;
  }
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/// @brief Route formatted lines to @p fn instead of stderr (nullptr restores).
inline void SetSink(LogSinkFn fn, void* context = nullptr) noexcept {
  std::lock_guard<std::mutex> lk(detail::Sink().mtx);
  detail::Sink().fn = fn;
  detail::Sink().context = context;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char out[640];
  (void)std::snprintf(out, sizeof(out), "%s [%s] [%s] %s (%s:%d)", ts,
                      detail::LevelTag(level),
                      category != nullptr ? category : "-", msg,
                      detail::Basename(file), line);

  detail::SinkSlot& sink = detail::Sink();
  {
    std::lock_guard<std::mutex> lk(sink.mtx);
    if (sink.fn != nullptr) {
      sink.fn(level, out, sink.context);
      return;
    }
  }
  (void)std::fprintf(stderr, "%s\n", out);
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace isv

// ============================================================================
// Macros
// ============================================================================

#define ISV_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                      \
    if (ISV_LOG_MIN_LEVEL <= 0) {                                           \
      ::isv::log::LogWrite(::isv::log::Level::kDebug, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ISV_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                      \
    if (ISV_LOG_MIN_LEVEL <= 1) {                                           \
      ::isv::log::LogWrite(::isv::log::Level::kInfo, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ISV_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                      \
    if (ISV_LOG_MIN_LEVEL <= 2) {                                           \
      ::isv::log::LogWrite(::isv::log::Level::kWarn, cat, __FILE__,        \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ISV_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                      \
    if (ISV_LOG_MIN_LEVEL <= 3) {                                           \
      ::isv::log::LogWrite(::isv::log::Level::kError, cat, __FILE__,       \
                           __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                       \
  } while (0)

#define ISV_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                      \
    ::isv::log::LogWrite(::isv::log::Level::kFatal, cat, __FILE__,         \
                         __LINE__, fmt, ##__VA_ARGS__);                     \
    std::abort();                                                           \
  } while (0)

#endif  // ISV_LOG_HPP_
