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
 * @file vocabulary.hpp
 * @brief Error-return vocabulary types shared by all isv modules.
 *
 * - expected<V, E>: value-or-error return, with a void specialization.
 * - optional<T>: "no answer" return used for neutral results.
 *
 * Compatible with -fno-exceptions: value() on an error is a programming
 * error caught by ISV_ASSERT, never a throw.
 */

#ifndef ISV_VOCABULARY_HPP_
#define ISV_VOCABULARY_HPP_

#include "isv/platform.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace isv {

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
using optional = std::optional<T>;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * @code
 *   expected<int, ConfigError> ParsePort(const char* s);
 *   auto r = ParsePort("8080");
 *   if (!r) { return r.get_error(); }
 *   use(r.value());
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) {
    return expected(std::in_place_index<0>, value);
  }
  static expected success(V&& value) {
    return expected(std::in_place_index<0>, std::move(value));
  }
  static expected error(E err) {
    return expected(std::in_place_index<1>, std::move(err));
  }

  bool has_value() const noexcept { return storage_.index() == 0U; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    ISV_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  const V& value() const& {
    ISV_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  V&& value() && {
    ISV_ASSERT(has_value());
    return std::get<0>(std::move(storage_));
  }

  template <typename U>
  V value_or(U&& fallback) const& {
    return has_value() ? std::get<0>(storage_)
                       : static_cast<V>(std::forward<U>(fallback));
  }

  const E& get_error() const {
    ISV_ASSERT(!has_value());
    return std::get<1>(storage_);
  }

 private:
  template <std::size_t I, typename... Args>
  explicit expected(std::in_place_index_t<I> tag, Args&&... args)
      : storage_(tag, std::forward<Args>(args)...) {}

  std::variant<V, E> storage_;
};

/// @brief void specialization: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(E err) { return expected(std::move(err)); }

  bool has_value() const noexcept { return !has_error_; }
  explicit operator bool() const noexcept { return has_value(); }

  const E& get_error() const {
    ISV_ASSERT(has_error_);
    return error_;
  }

 private:
  expected() noexcept : error_(), has_error_(false) {}
  explicit expected(E err) : error_(std::move(err)), has_error_(true) {}

  E error_;
  bool has_error_;
};

}  // namespace isv

#endif  // ISV_VOCABULARY_HPP_
