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
 * @file supervisor_options.hpp
 * @brief Tunables of the supervisor and of the worker command line.
 *
 * Config layout (INI shown, JSON/YAML use the same section/key names):
 * @code
 *   [supervisor]
 *   max_startup_failures = 3
 *   startup_timeout_ms   = 10000
 *
 *   [worker]
 *   program              = /usr/bin/java
 *   main_class           = interactions.WorkerMain
 *   class_path           = /opt/app/lib/worker.jar:/opt/app/lib/runtime.jar
 *   working_dir          = /home/user/project
 *   allow_assertions     = true
 *   allow_private_access = false
 *   heap_size_mb         = 512
 *   extra_args           = -Dfile.encoding=UTF-8 "-Duser.name=A B"
 * @endcode
 */

#ifndef ISV_SUPERVISOR_OPTIONS_HPP_
#define ISV_SUPERVISOR_OPTIONS_HPP_

#include "isv/config.hpp"
#include "isv/platform.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace isv {

static constexpr uint32_t kDefaultMaxStartupFailures = 3U;
static constexpr uint32_t kDefaultStartupTimeoutMs = 10000U;

struct SupervisorOptions {
  // --- lifecycle ---
  uint32_t max_startup_failures = kDefaultMaxStartupFailures;
  uint32_t startup_timeout_ms = kDefaultStartupTimeoutMs;

  // --- worker launch ---
  std::string worker_program;            ///< Executable started for each worker
  std::string main_class;                ///< Entry point passed after the options
  std::vector<std::string> class_path;   ///< Ordered class path entries
  std::string working_dir;               ///< Empty: current directory
  bool allow_assertions = false;
  bool allow_private_access = false;
  uint32_t heap_size_mb = 0U;            ///< 0: worker default
  std::string extra_args;                ///< Shell-style, tokenized at spawn
};

/**
 * @brief Split a path list on @p separator, dropping empty entries.
 */
inline std::vector<std::string> SplitPathList(const std::string& list,
                                              char separator = kPathListSeparator) {
  std::vector<std::string> out;
  std::string::size_type begin = 0;
  while (begin <= list.size()) {
    std::string::size_type end = list.find(separator, begin);
    if (end == std::string::npos) end = list.size();
    if (end > begin) out.push_back(list.substr(begin, end - begin));
    begin = end + 1U;
  }
  return out;
}

/**
 * @brief Read SupervisorOptions from sections [supervisor] and [worker].
 *
 * Missing keys keep their defaults. A non-positive max_startup_failures or
 * startup_timeout_ms is ignored.
 */
inline SupervisorOptions LoadSupervisorOptions(const ConfigStore& cfg) {
  SupervisorOptions opt;

  optional<int32_t> failures = cfg.FindInt("supervisor", "max_startup_failures");
  if (failures.has_value() && *failures > 0) {
    opt.max_startup_failures = static_cast<uint32_t>(*failures);
  }
  optional<int32_t> timeout = cfg.FindInt("supervisor", "startup_timeout_ms");
  if (timeout.has_value() && *timeout > 0) {
    opt.startup_timeout_ms = static_cast<uint32_t>(*timeout);
  }

  opt.worker_program = cfg.GetString("worker", "program", "");
  opt.main_class = cfg.GetString("worker", "main_class", "");
  opt.class_path = SplitPathList(cfg.GetString("worker", "class_path", ""));
  opt.working_dir = cfg.GetString("worker", "working_dir", "");
  opt.allow_assertions = cfg.GetBool("worker", "allow_assertions", false);
  opt.allow_private_access = cfg.GetBool("worker", "allow_private_access", false);
  int32_t heap = cfg.GetInt("worker", "heap_size_mb", 0);
  opt.heap_size_mb = (heap > 0) ? static_cast<uint32_t>(heap) : 0U;
  opt.extra_args = cfg.GetString("worker", "extra_args", "");
  return opt;
}

}  // namespace isv

#endif  // ISV_SUPERVISOR_OPTIONS_HPP_
