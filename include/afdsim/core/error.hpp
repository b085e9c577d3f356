/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file error.hpp
 * @brief Error handling system using Result<T, E> pattern
 * @version 0.1.0
 *
 * Every fallible afdsim operation returns Result<T>. An Error may carry the
 * Error that caused it, so an aborted simulation run keeps the identity of
 * the failing layer and the original formula or validation failure.
 */

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "types.hpp"

namespace afdsim {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * @enum ErrorCode
 * @brief Standard error codes used throughout afdsim
 */
enum class ErrorCode : u32 {
  // Success
  Ok = 0,

  // Estimation errors (100-199)
  ConfigValidation = 100,
  FormulaDomain = 101,
  BackendUnavailable = 102,
  AggregationAborted = 103,

  // I/O errors (200-299)
  FileNotFound = 200,
  ParseError = 201,
  IOError = 202,

  // Generic errors (900-999)
  InvalidArgument = 900,
  NotImplemented = 901,
  InternalError = 902,
  Unknown = 999,
};

/**
 * @brief Convert ErrorCode to string representation
 */
constexpr std::string_view error_code_str(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::Ok:
      return "Ok";

    // Estimation
    case ErrorCode::ConfigValidation:
      return "ConfigValidationError";
    case ErrorCode::FormulaDomain:
      return "FormulaDomainError";
    case ErrorCode::BackendUnavailable:
      return "BackendUnavailableError";
    case ErrorCode::AggregationAborted:
      return "AggregationAbortedError";

    // I/O
    case ErrorCode::FileNotFound:
      return "FileNotFound";
    case ErrorCode::ParseError:
      return "ParseError";
    case ErrorCode::IOError:
      return "IOError";

    // Generic
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::NotImplemented:
      return "NotImplemented";
    case ErrorCode::InternalError:
      return "InternalError";
    case ErrorCode::Unknown:
      return "Unknown";

    default:
      return "UnknownErrorCode";
  }
}

// ============================================================================
// Error Class
// ============================================================================

/**
 * @class Error
 * @brief Represents an error with code, optional message and optional cause
 */
class Error {
 public:
  /**
   * @brief Default constructor creates an Ok error
   */
  Error() noexcept : code_(ErrorCode::Ok) {}

  /**
   * @brief Construct error with code only
   */
  explicit Error(ErrorCode code) noexcept : code_(code) {}

  /**
   * @brief Construct error with code and message
   */
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  /**
   * @brief Construct error with code, message and the error that caused it
   */
  Error(ErrorCode code, std::string message, Error cause)
      : code_(code),
        message_(std::move(message)),
        cause_(std::make_shared<const Error>(std::move(cause))) {}

  /**
   * @brief Get the error code
   */
  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

  /**
   * @brief Get the error message
   */
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  /**
   * @brief Get the underlying cause, nullptr if this is a root error
   */
  [[nodiscard]] const Error* cause() const noexcept { return cause_.get(); }

  /**
   * @brief Walk the cause chain down to the originating error
   */
  [[nodiscard]] const Error& root_cause() const noexcept {
    const Error* current = this;
    while (current->cause_ != nullptr) {
      current = current->cause_.get();
    }
    return *current;
  }

  [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }

  [[nodiscard]] bool is_err() const noexcept { return code_ != ErrorCode::Ok; }

  /**
   * @brief Get full error description, including the cause chain
   */
  [[nodiscard]] std::string to_string() const {
    if (is_ok()) {
      return "Ok";
    }
    std::string out(error_code_str(code_));
    if (!message_.empty()) {
      out += ": " + message_;
    }
    if (cause_ != nullptr) {
      out += " (caused by " + cause_->to_string() + ")";
    }
    return out;
  }

  /**
   * @brief Boolean conversion for easy checking
   */
  [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

 private:
  ErrorCode code_;
  std::string message_;
  std::shared_ptr<const Error> cause_;
};

// ============================================================================
// Result<T, E> Type
// ============================================================================

/**
 * @class Result
 * @brief Either a success value of type T or an error of type E
 *
 * @tparam T The type of the success value
 * @tparam E The type of the error (defaults to Error)
 */
template <typename T, typename E = Error>
class [[nodiscard]] Result {
 public:
  using value_type = T;
  using error_type = E;

  constexpr Result(T value) : storage_(std::move(value)) {}

  constexpr Result(E error) : storage_(std::move(error)) {}

  [[nodiscard]] constexpr bool is_ok() const noexcept {
    return std::holds_alternative<T>(storage_);
  }

  [[nodiscard]] constexpr bool is_err() const noexcept {
    return std::holds_alternative<E>(storage_);
  }

  [[nodiscard]] constexpr explicit operator bool() const noexcept {
    return is_ok();
  }

  /**
   * @brief Get the value (must be Ok)
   */
  [[nodiscard]] constexpr T& value() & { return std::get<T>(storage_); }

  [[nodiscard]] constexpr const T& value() const& {
    return std::get<T>(storage_);
  }

  [[nodiscard]] constexpr T&& value() && {
    return std::get<T>(std::move(storage_));
  }

  /**
   * @brief Get the error (must be Err)
   */
  [[nodiscard]] constexpr E& error() & { return std::get<E>(storage_); }

  [[nodiscard]] constexpr const E& error() const& {
    return std::get<E>(storage_);
  }

  [[nodiscard]] constexpr E&& error() && {
    return std::get<E>(std::move(storage_));
  }

  /**
   * @brief Get value or return default if error
   */
  template <typename U>
  [[nodiscard]] constexpr T value_or(U&& default_value) const& {
    return is_ok() ? value() : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  [[nodiscard]] constexpr T value_or(U&& default_value) && {
    return is_ok() ? std::move(value())
                   : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Unwrap value (terminates if error)
   */
  [[nodiscard]] constexpr T unwrap() && {
    if (is_err()) {
      std::terminate();
    }
    return std::move(value());
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for void success type
 */
template <typename E>
class [[nodiscard]] Result<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Result() : has_value_(true), error_() {}

  Result(E error) : has_value_(false), error_(std::move(error)) {}

  [[nodiscard]] bool is_ok() const noexcept { return has_value_; }

  [[nodiscard]] bool is_err() const noexcept { return !has_value_; }

  [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] E& error() & { return error_; }

  [[nodiscard]] const E& error() const& { return error_; }

  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  bool has_value_;
  E error_;
};

// ============================================================================
// Helper Functions
// ============================================================================

template <typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
  return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> Ok() { return Result<void>(); }

template <typename T>
[[nodiscard]] Result<T> Err(Error error) {
  return Result<T>(std::move(error));
}

template <typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
  return Result<T>(Error(code));
}

template <typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
  return Result<T>(Error(code, std::move(message)));
}

}  // namespace afdsim
