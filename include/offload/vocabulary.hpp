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
 * @brief Small vocabulary types shared by all offload modules.
 *
 *   - expected<V, E>   value-or-error return type (no exceptions)
 *   - NewType<T, Tag>  strong typedef for identifiers
 *   - Unit             empty value for outcomes that carry no data
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef OFFLOAD_VOCABULARY_HPP_
#define OFFLOAD_VOCABULARY_HPP_

#include "offload/platform.hpp"

#include <cstdint>

#include <new>
#include <type_traits>
#include <utility>

namespace offload {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the named factories:
 *
 *   return expected<int, MyError>::success(42);
 *   return expected<int, MyError>::error(MyError::kBad);
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& value) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(value);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& value) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.value)) V(std::move(value));
    r.has_value_ = true;
    return r;
  }

  static expected error(const E& err) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.err)) E(err);
    r.has_value_ = false;
    return r;
  }

  static expected error(E&& err) {
    expected r;
    ::new (static_cast<void*>(&r.storage_.err)) E(std::move(err));
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
    } else {
      ::new (static_cast<void*>(&storage_.err)) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&storage_.value))
          V(std::move(other.storage_.value));
    } else {
      ::new (static_cast<void*>(&storage_.err))
          E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value)) V(other.storage_.value);
      } else {
        ::new (static_cast<void*>(&storage_.err)) E(other.storage_.err);
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&storage_.value))
            V(std::move(other.storage_.value));
      } else {
        ::new (static_cast<void*>(&storage_.err))
            E(std::move(other.storage_.err));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    OFFLOAD_ASSERT(has_value_);
    return storage_.value;
  }

  const V& value() const& noexcept {
    OFFLOAD_ASSERT(has_value_);
    return storage_.value;
  }

  V&& value() && noexcept {
    OFFLOAD_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const noexcept {
    OFFLOAD_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    OFFLOAD_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : err_(err), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/// @brief Strong typedef: distinct identifier types over the same scalar.
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr explicit NewType(T v) noexcept : value_(v) {}
  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& o) const noexcept {
    return value_ == o.value_;
  }
  constexpr bool operator!=(const NewType& o) const noexcept {
    return value_ != o.value_;
  }

 private:
  T value_;
};

// ============================================================================
// Unit
// ============================================================================

/// @brief Empty value for outcomes that only signal completion.
struct Unit {};

}  // namespace offload

#endif  // OFFLOAD_VOCABULARY_HPP_
