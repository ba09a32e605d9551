// include/runbox/core/status.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>

namespace runbox {

class Status {
 public:
  enum class Code : int {
    kOk = 0,

    // Caller errors
    kInvalidRequest,
    kUnauthorized,

    // Pipeline stages
    kNoEntrypoint,
    kWorkspaceCollision,
    kInvalidArchive,
    kDependencyInstallFailed,
    kPublishFailed,

    // Environment / IO
    kNotFound,
    kIoError,

    // Config parsing
    kParseError,

    // System / unexpected
    kInternal,
  };

  Status() = default;  // OK
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  [[nodiscard]] bool ok() const noexcept { return code_ == Code::kOk; }
  [[nodiscard]] Code code() const noexcept { return code_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  static Status ok_status() { return Status(); }

  static Status invalid_request(std::string msg) { return Status(Code::kInvalidRequest, std::move(msg)); }
  static Status unauthorized(std::string msg) { return Status(Code::kUnauthorized, std::move(msg)); }
  static Status no_entrypoint(std::string msg) { return Status(Code::kNoEntrypoint, std::move(msg)); }
  static Status workspace_collision(std::string msg) { return Status(Code::kWorkspaceCollision, std::move(msg)); }
  static Status invalid_archive(std::string msg) { return Status(Code::kInvalidArchive, std::move(msg)); }
  static Status dependency_install_failed(std::string msg) { return Status(Code::kDependencyInstallFailed, std::move(msg)); }
  static Status publish_failed(std::string msg) { return Status(Code::kPublishFailed, std::move(msg)); }
  static Status not_found(std::string msg) { return Status(Code::kNotFound, std::move(msg)); }
  static Status io_error(std::string msg) { return Status(Code::kIoError, std::move(msg)); }
  static Status parse_error(std::string msg) { return Status(Code::kParseError, std::move(msg)); }
  static Status internal(std::string msg) { return Status(Code::kInternal, std::move(msg)); }

 private:
  Code code_ = Code::kOk;
  std::string message_;
};

// Stable name used in structured error output, e.g. "NoEntrypoint".
const char* code_name(Status::Code code) noexcept;

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

#define RUNBOX_RETURN_IF_ERROR(expr)     \
  do {                                   \
    const ::runbox::Status _s = (expr);  \
    if (!_s.ok()) return _s;             \
  } while (0)

// For functions returning Result<T>.
#define RUNBOX_RESULT_RETURN_IF_ERROR(T, expr)          \
  do {                                                  \
    const ::runbox::Status _s = (expr);                 \
    if (!_s.ok()) return ::runbox::Result<T>::err(_s);  \
  } while (0)

}  // namespace runbox
