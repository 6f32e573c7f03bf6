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
 * @brief Core vocabulary types: expected, optional, FixedString, clocks.
 *
 * Header-only, C++17. Library code reports failures through
 * expected<V, E> with enum class error codes instead of exceptions.
 */

#ifndef MG_VOCABULARY_HPP_
#define MG_VOCABULARY_HPP_

#include "mg/platform.hpp"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>

namespace mg {

// ============================================================================
// Shared error codes
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result.
 *
 * Construct with expected::success(v) or expected::error(e). Supports
 * move-only value types (e.g. std::unique_ptr).
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected r;
    ::new (static_cast<void*>(r.storage_)) V(val);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& val) {
    expected r;
    ::new (static_cast<void*>(r.storage_)) V(static_cast<V&&>(val));
    r.has_value_ = true;
    return r;
  }

  static expected error(E err) noexcept {
    expected r;
    r.err_ = err;
    return r;
  }

  expected(const expected& other) : has_value_(false), err_(other.err_) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) V(other.value());
      has_value_ = true;
    }
  }

  expected(expected&& other) noexcept(std::is_nothrow_move_constructible<V>::value)
      : has_value_(false), err_(other.err_) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) V(static_cast<V&&>(other.value()));
      has_value_ = true;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) V(other.value());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) V(static_cast<V&&>(other.value()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() noexcept {
    MG_ASSERT(has_value_);
    return *reinterpret_cast<V*>(storage_);
  }

  const V& value() const noexcept {
    MG_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(storage_);
  }

  E get_error() const noexcept { return err_; }

  V value_or(const V& fallback) const {
    return has_value_ ? value() : fallback;
  }

 private:
  expected() noexcept : has_value_(false), err_() {}

  void Destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(storage_)->~V();
      has_value_ = false;
    }
  }

  alignas(V) unsigned char storage_[sizeof(V)];
  bool has_value_;
  E err_;
};

/** @brief expected<void, E>: success carries no payload. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E()); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }
  E get_error() const noexcept { return err_; }

 private:
  expected(bool ok, E err) noexcept : has_value_(ok), err_(err) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(storage_)) T(val);
  }

  optional(const optional& other) : has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) T(other.value());
      has_value_ = true;
    }
  }

  optional(optional&& other) noexcept(std::is_nothrow_move_constructible<T>::value)
      : has_value_(false) {
    if (other.has_value_) {
      ::new (static_cast<void*>(storage_)) T(static_cast<T&&>(other.value()));
      has_value_ = true;
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) T(other.value());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(storage_)) T(static_cast<T&&>(other.value()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    MG_ASSERT(has_value_);
    return *reinterpret_cast<T*>(storage_);
  }

  const T& value() const noexcept {
    MG_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(storage_);
  }

  T value_or(const T& fallback) const {
    return has_value_ ? value() : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

/** @brief Tag selecting the truncating FixedString constructor. */
struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Stack-allocated, NUL-terminated string of at most N characters.
 *
 * Literals that do not fit are rejected at compile time; runtime strings
 * must go through the TruncateToCapacity overloads.
 */
template <uint32_t N>
class FixedString {
 public:
  FixedString() noexcept : size_(0) { buf_[0] = '\0'; }

  template <uint32_t M>
  FixedString(const char (&lit)[M]) noexcept : size_(M - 1) {  // NOLINT
    static_assert(M - 1 <= N, "literal exceeds FixedString capacity");
    std::memcpy(buf_, lit, M);
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0) {
    buf_[0] = '\0';
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0) {
    buf_[0] = '\0';
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    assign(TruncateToCapacity, str,
           (str != nullptr) ? static_cast<uint32_t>(std::strlen(str)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    size_ = (len > N) ? N : len;
    if (size_ > 0U) {
      std::memcpy(buf_, str, size_);
    }
    buf_[size_] = '\0';
  }

  /** @brief Append as much of @p str as fits. */
  void append(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) return;
    while (size_ < N && *str != '\0') {
      buf_[size_++] = *str++;
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return N; }
  bool empty() const noexcept { return size_ == 0U; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }
  bool operator!=(const char* rhs) const noexcept { return !(*this == rhs); }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

 private:
  char buf_[N + 1];
  uint32_t size_;
};

// ============================================================================
// Clocks
// ============================================================================

/** @brief Monotonic nanoseconds since an unspecified epoch. */
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

inline uint64_t SteadyNowMs() noexcept { return SteadyNowNs() / 1000000ULL; }

}  // namespace mg

#endif  // MG_VOCABULARY_HPP_
