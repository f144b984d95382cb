// File: include/reel/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace reel {

class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Caller errors
    kInvalidArgument,
    kOutOfRange,

    // Environment / IO
    kNotFound,
    kIoError,
    kPermissionDenied,

    // Data / parsing
    kParseError,
    kCorruptData,

    // System / unexpected
    kUnsupported,
    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  // "parse_error: <message>"; "ok" when ok.
  [[nodiscard]] std::string to_string() const {
    if (ok()) return "ok";
    return std::string(code_name(code_)) + ": " + message_;
  }

  // Same code, message prefixed with where it happened ("load_config: ...").
  [[nodiscard]] Status with_context(const std::string& where) const {
    if (ok()) return *this;
    return Status(code_, where + ": " + message_);
  }

  static const char* code_name(Code c) noexcept {
    switch (c) {
      case Code::kOk: return "ok";
      case Code::kInvalidArgument: return "invalid_argument";
      case Code::kOutOfRange: return "out_of_range";
      case Code::kNotFound: return "not_found";
      case Code::kIoError: return "io_error";
      case Code::kPermissionDenied: return "permission_denied";
      case Code::kParseError: return "parse_error";
      case Code::kCorruptData: return "corrupt_data";
      case Code::kUnsupported: return "unsupported";
      case Code::kInternal: return "internal";
    }
    return "unknown";
  }

  static Status ok_status() { return Status(); }

  static Status invalid_argument(std::string msg) { return Status(Code::kInvalidArgument, std::move(msg)); }
  static Status out_of_range(std::string msg) { return Status(Code::kOutOfRange, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status permission_denied(std::string msg) { return Status(Code::kPermissionDenied, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status corrupt_data(std::string msg) { return Status(Code::kCorruptData, std::move(msg)); }
  static Status unsupported(std::string msg) { return Status(Code::kUnsupported, std::move(msg)); }
  static Status internal(std::string msg) { return Status(Code::kInternal, std::move(msg)); }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

template <typename T>
class Result {
 public:
  Result() = delete;

  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(Status status) { return Result(std::move(status)); }

  [[nodiscard]] bool ok() const noexcept { return status_.ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T* value_if_ok() const noexcept { return ok() ? &(*value_) : nullptr; }
  [[nodiscard]] T* value_if_ok() noexcept { return ok() ? &(*value_) : nullptr; }

  [[nodiscard]] const T& value() const { return value_.value(); }
  [[nodiscard]] T& value() { return value_.value(); }

  // Value when ok, `fallback` otherwise.
  [[nodiscard]] T value_or(T fallback) const { return ok() ? *value_ : std::move(fallback); }

  [[nodiscard]] const T& operator*() const { return value(); }
  [[nodiscard]] T& operator*() { return value(); }

  [[nodiscard]] const T* operator->() const { return &value(); }
  [[nodiscard]] T* operator->() { return &value(); }

  [[nodiscard]] T take_value() { return std::move(value_.value()); }

 private:
  explicit Result(T value) : value_(std::move(value)), status_(Status::ok_status()) {}
  explicit Result(Status status) : value_(std::nullopt), status_(std::move(status)) {}

  std::optional<T> value_;
  Status status_;
};

#define REEL_RETURN_IF_ERROR(expr)      \
  do {                                  \
    const ::reel::Status _s = (expr);   \
    if (!_s.ok()) return _s;            \
  } while (0)

// Same, from a function returning Result<T>.
#define REEL_RETURN_IF_ERROR_RESULT(expr, T)                   \
  do {                                                         \
    const ::reel::Status _s = (expr);                          \
    if (!_s.ok()) return ::reel::Result<T>::err(_s);           \
  } while (0)

}  // namespace reel
