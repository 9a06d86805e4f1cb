#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace siphon {

enum class ErrorCode {
  // Configuration
  MissingConfigField,
  MissingRateLimitField,
  InvalidRateLimit,
  NoRequests,
  UnableToParse,

  // Transport
  RequestFailed,

  // Negotiation
  UnsupportedDecodeType,

  // Persistence
  StorageFailed,
  TransactionFailed,

  // Lifecycle
  Cancelled,
  InvalidState,
};

struct Error {
  ErrorCode code;
  std::string message;
};

using MaybeError = std::optional<Error>;

constexpr std::string_view error_category(ErrorCode code) {
  switch (code) {
    case ErrorCode::MissingConfigField:
    case ErrorCode::MissingRateLimitField:
    case ErrorCode::InvalidRateLimit:
    case ErrorCode::NoRequests:
    case ErrorCode::UnableToParse:
      return "configuration";
    case ErrorCode::RequestFailed:
      return "transport";
    case ErrorCode::UnsupportedDecodeType:
      return "negotiation";
    case ErrorCode::StorageFailed:
    case ErrorCode::TransactionFailed:
      return "persistence";
    case ErrorCode::Cancelled:
    case ErrorCode::InvalidState:
      return "lifecycle";
  }
  return "unknown";
}

// Prefix the message with context, keeping the code.
Error wrap_error(const Error& err, std::string_view context);

Error missing_config_field(std::string_view field);
Error missing_rate_limit_field(std::string_view field);
Error unable_to_parse(std::string_view name);

// Value or Error. Stand-in for std::expected<T, Error>.
template <typename T>
class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Error error) : error_(std::move(error)) {}

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  T& value() & { return *value_; }
  const T& value() const& { return *value_; }
  T&& value() && { return std::move(*value_); }

  T& operator*() & { return *value_; }
  const T& operator*() const& { return *value_; }
  T* operator->() { return &*value_; }
  const T* operator->() const { return &*value_; }

  const Error& error() const { return *error_; }

private:
  std::optional<T> value_;
  std::optional<Error> error_;
};

// First error wins. Later errors are counted and dropped, so a failed run
// reports one root cause and may hide secondary failures.
//
// A slot built with a parent also records every error into the parent, so a
// stage can keep its own view while the run keeps one register for all stages.
class ErrorSlot {
public:
  ErrorSlot() = default;
  explicit ErrorSlot(std::shared_ptr<ErrorSlot> parent) : parent_(std::move(parent)) {}

  // Returns true if err became the recorded error of this slot.
  bool record(Error err);

  MaybeError get() const;
  bool has_error() const;
  std::size_t dropped() const { return dropped_.load(); }

private:
  std::shared_ptr<ErrorSlot> parent_;
  mutable std::mutex mutex_;
  MaybeError error_;
  std::atomic<std::size_t> dropped_{0};
};

}  // namespace siphon
