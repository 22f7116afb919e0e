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
 * @brief Vocabulary types for ctlapi: ErrorCode, HandlerError and expected.
 *
 * Transport functions report ErrorCode; endpoint handlers report
 * HandlerError, whose kind decides whether the failure stays local to the
 * request or escalates to host shutdown.
 */

#ifndef CTLAPI_VOCABULARY_HPP_
#define CTLAPI_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

#ifndef CTLAPI_ASSERT
#define CTLAPI_ASSERT(cond) ((void)(cond))
#endif

namespace ctlapi {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kFrameParseError = 1,
  kInvalidRequest = 2,
  kConnectionClosed = 3,
  kSocketError = 4
};

inline const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kFrameParseError:
      return "frame parse error";
    case ErrorCode::kInvalidRequest:
      return "invalid request";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kSocketError:
      return "socket error";
  }
  return "unknown";
}

// Command errors are reported to the requesting client only. Internal
// errors are reported to the client and then shut the host down.
enum class ErrorKind : uint8_t { kCommand, kInternal };

struct HandlerError {
  ErrorKind kind = ErrorKind::kCommand;
  std::string message;

  static HandlerError command(std::string msg) { return {ErrorKind::kCommand, std::move(msg)}; }
  static HandlerError internal(std::string msg) { return {ErrorKind::kInternal, std::move(msg)}; }

  bool is_fatal() const { return kind == ErrorKind::kInternal; }
};

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) {
    expected e;
    e.has_value_ = false;
    e.err_ = std::move(err);
    return e;
  }

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept
      : storage_{}, err_(std::move(other.err_)), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = std::move(other.err_);
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    CTLAPI_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    CTLAPI_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  const E& get_error() const noexcept {
    CTLAPI_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) {
    expected e;
    e.has_value_ = false;
    e.err_ = std::move(err);
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const noexcept {
    CTLAPI_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// Result of an endpoint handler.
using Outcome = expected<void, HandlerError>;

}  // namespace ctlapi

#endif  // CTLAPI_VOCABULARY_HPP_
