/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
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
 * @brief Vocabulary types for EWSC: Error, expected, optional, ScopeGuard.
 *
 * Derived from newosp vocabulary (iceoryx inspired).
 * expected<V, E> also carries move-only values (channels, streams).
 */

#ifndef EWSC_VOCABULARY_HPP_
#define EWSC_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <utility>

// Assertion macro for embedded systems (no-op in release)
#ifndef EWSC_ASSERT
#define EWSC_ASSERT(cond) ((void)(cond))
#endif

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define EWSC_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define EWSC_THROW(ex)            \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

namespace ewsc {

// ============================================================================
// Error Types
// ============================================================================

// One code per failing stage of a connection attempt.
enum class ErrorCode : uint8_t {
  kOk = 0,
  kRequestConstruction = 1,  // Malformed URL, missing host, bad header
  kUnsupportedScheme = 2,    // No explicit port and scheme is not ws/wss
  kTransport = 3,            // Resolve/dial failed or post-connect tuning failed
  kSecureChannel = 4,        // TLS negotiation or certificate validation failed
  kHandshake = 5,            // WebSocket upgrade rejected or malformed
  kInvalidState = 6,         // Operation used out of order
  kInternalError = 255
};

/**
 * @brief Error value carried by every fallible EWSC call.
 *
 * os_error holds the captured errno for transport failures.
 * detail holds the mbedTLS return code (kSecureChannel), the HTTP status
 * (kHandshake, when a status line was received) or a getaddrinfo code.
 */
struct Error {
  ErrorCode code = ErrorCode::kOk;
  int os_error = 0;
  int detail = 0;

  static Error make(ErrorCode c, int os_err = 0, int det = 0) noexcept {
    Error e;
    e.code = c;
    e.os_error = os_err;
    e.detail = det;
    return e;
  }
};

inline bool operator==(const Error& a, const Error& b) noexcept {
  return a.code == b.code && a.os_error == b.os_error && a.detail == b.detail;
}

inline bool operator!=(const Error& a, const Error& b) noexcept { return !(a == b); }

const char* to_string(ErrorCode code) noexcept;

// Human readable message, e.g. "transport error: Connection refused"
std::string to_string(const Error& err);

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 * Copy operations are only instantiated for copyable V, so move-only values
 * (channels, streams, sessions) travel through it as well.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) noexcept {
    expected e;
    e.construct(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.construct(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept : err_(other.err_) {
    if (other.has_value_) construct(other.value());
  }

  expected(expected&& other) noexcept : err_(other.err_) {
    if (other.has_value_) construct(static_cast<V&&>(other.value()));
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      destroy();
      err_ = other.err_;
      if (other.has_value_) construct(other.value());
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      err_ = other.err_;
      if (other.has_value_) construct(static_cast<V&&>(other.value()));
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    EWSC_ASSERT(has_value_);
    return *ptr();
  }

  const V& value() const& noexcept {
    EWSC_ASSERT(has_value_);
    return *ptr();
  }

  // Moves the value out: std::move(result).value()
  V&& value() && noexcept {
    EWSC_ASSERT(has_value_);
    return static_cast<V&&>(*ptr());
  }

  E get_error() const noexcept {
    EWSC_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

 private:
  expected() noexcept = default;

  template <typename U>
  void construct(U&& val) noexcept {
    ::new (static_cast<void*>(storage_)) V(static_cast<U&&>(val));
    has_value_ = true;
  }

  void destroy() noexcept {
    if (has_value_) {
      ptr()->~V();
      has_value_ = false;
    }
  }

  V* ptr() noexcept { return std::launder(reinterpret_cast<V*>(storage_)); }
  const V* ptr() const noexcept { return std::launder(reinterpret_cast<const V*>(storage_)); }

  alignas(V) unsigned char storage_[sizeof(V)];
  E err_{};
  bool has_value_{false};
};

// Success or error with no value
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    EWSC_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// optional<T> - Lightweight nullable value
// ============================================================================

// Implicitly constructible from T so optional parameters accept plain values.
template <typename T>
class optional final {
 public:
  optional() noexcept = default;

  optional(const T& val) noexcept { construct(val); }             // NOLINT
  optional(T&& val) noexcept { construct(static_cast<T&&>(val)); }  // NOLINT

  optional(const optional& other) noexcept {
    if (other.has_value_) construct(other.value());
  }

  optional(optional&& other) noexcept {
    if (other.has_value_) construct(static_cast<T&&>(other.value()));
  }

  optional& operator=(const optional& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) construct(other.value());
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) construct(static_cast<T&&>(other.value()));
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    EWSC_ASSERT(has_value_);
    return *ptr();
  }

  const T& value() const noexcept {
    EWSC_ASSERT(has_value_);
    return *ptr();
  }

  T value_or(const T& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

  void reset() noexcept {
    if (has_value_) {
      ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  template <typename U>
  void construct(U&& val) noexcept {
    ::new (static_cast<void*>(storage_)) T(static_cast<U&&>(val));
    has_value_ = true;
  }

  T* ptr() noexcept { return std::launder(reinterpret_cast<T*>(storage_)); }
  const T* ptr() const noexcept { return std::launder(reinterpret_cast<const T*>(storage_)); }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_{false};
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Runs a cleanup callable on scope exit unless released.
 *
 *   ScopeGuard free_res([res]() { ::freeaddrinfo(res); });
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F cleanup) noexcept : cleanup_(std::move(cleanup)) {}

  ~ScopeGuard() {
    if (active_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  F cleanup_;
  bool active_{true};
};

}  // namespace ewsc

#endif  // EWSC_VOCABULARY_HPP_
