#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace repute {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout Repute
 *
 * This header defines the identifier aliases shared by every module and the
 * Result<T> wrapper that carries either a value or a typed error.
 */

/// @brief Opaque account identifier; the identity model lives elsewhere
using Address = std::string;

/// @brief Cumulative reputation score
using Points = uint64_t;

/// @brief Progression tier derived from points
using Level = uint64_t;

/// @brief Position of a badge inside the catalog, starting at 0
using BadgeIndex = uint64_t;

/// @brief Minted token identifier, starting at 1 (0 means "no token")
using TokenId = uint64_t;

/// @brief Host supplied time in seconds
using Timestamp = uint64_t;

/// @brief Calendar day number, floor(timestamp / seconds_per_day)
using Day = uint64_t;

/// @brief Reserved token id meaning "nothing minted"
constexpr TokenId NO_TOKEN = 0;

/**
 * @brief Failure categories surfaced by every mutating and query operation
 *
 * The string form returned by error_code_to_string() is stable and is what
 * the command surface reports to callers.
 */
enum class ErrorCode {
  NONE = 0,
  ALREADY_ACTIONED,        ///< Second check-in on the same day
  INVALID_INPUT,           ///< Empty label, empty address, malformed request
  SELF_ENDORSEMENT,        ///< Endorser and target are the same account
  DUPLICATE_ENDORSEMENT,   ///< Ordered pair already recorded
  INSUFFICIENT_REPUTATION, ///< Endorser below the reputation gate
  OUT_OF_RANGE,            ///< Badge index beyond catalog size on mint
  BADGE_LOCKED,            ///< Mint attempted before unlock
  ALREADY_MINTED,          ///< Token already exists for (user, badge)
  NOT_FOUND,               ///< Unknown badge or token on query/update
  NON_TRANSFERABLE,        ///< Any transfer request
  UNAUTHORIZED,            ///< Non-admin calling a catalog mutation
  POINTS_OVERFLOW,         ///< Point balance would wrap
  CONFIG_ERROR,            ///< Configuration could not be loaded or is invalid
  INTERNAL_ERROR           ///< Library failure outside the caller's control
};

/// @brief Stable upper-case name of an error code
const char *error_code_to_string(ErrorCode code) noexcept;

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or an ErrorCode with a message. Errors are
 * returned, never thrown, so a failed action is visible at the call site.
 *
 * @tparam T The type of the success value
 *
 * Example usage:
 * @code
 * auto result = engine.check_in("alice");
 * if (result.is_ok()) {
 *     Points awarded = result.value();
 * } else if (result.code() == ErrorCode::ALREADY_ACTIONED) {
 *     // come back tomorrow
 * }
 * @endcode
 */
template <typename T> class Result {
private:
  bool success_;
  T value_;
  ErrorCode code_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value)
      : success_(true), value_(std::move(value)), code_(ErrorCode::NONE) {}

  /**
   * @brief Construct a failed result
   * @param code Failure category, must not be ErrorCode::NONE
   * @param error Human readable detail
   */
  Result(ErrorCode code, std::string error)
      : success_(false), value_(), code_(code), error_(std::move(error)) {}

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }
  T &&value() && { return std::move(value_); }

  /// @brief Failure category, ErrorCode::NONE on success
  ErrorCode code() const noexcept { return code_; }

  /// @brief Failure detail, empty on success
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }

  /**
   * @brief Re-type a failure so it can be propagated from a caller with a
   * different success type
   */
  template <typename U> Result<U> propagate() const {
    return Result<U>(code_, error_);
  }
};

} // namespace common
} // namespace repute
