#pragma once

/// @file exception.h
/// @brief Exception classes for libnotechart.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace notechart {

/// @brief Base exception class for libnotechart errors.
class NotechartException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit NotechartException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  NotechartException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def NOTECHART_CHECK
/// @brief Throws NotechartException if condition is false.
#define NOTECHART_CHECK(cond, code)   \
  do {                                \
    if (!(cond)) {                    \
      throw NotechartException(code); \
    }                                 \
  } while (0)

/// @def NOTECHART_CHECK_MSG
/// @brief Throws NotechartException with custom message if condition is false.
#define NOTECHART_CHECK_MSG(cond, code, msg) \
  do {                                       \
    if (!(cond)) {                           \
      throw NotechartException(code, msg);   \
    }                                        \
  } while (0)

}  // namespace notechart
