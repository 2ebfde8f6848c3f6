#pragma once

/// @file types.h
/// @brief Common type definitions for libnotechart.

#include <cstddef>
#include <cstdint>
#include <string>

namespace notechart {

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  InvalidFormat,
  DecodeFailed,
  InvalidParameter,
  OutOfMemory,
};

/// @brief Chart difficulty selector.
enum class Difficulty : int {
  Easy = 0,
  Medium = 1,
  Hard = 2,
};

/// @brief Input lane of a note.
/// @details Up/Down form the strong pair, Left/Right the weak pair.
enum class Lane : int {
  Up = 0,
  Down = 1,
  Left = 2,
  Right = 3,
};

/// @brief Returns the key name bound to a lane.
/// @param lane Lane
/// @return "ArrowUp", "ArrowDown", "ArrowLeft" or "ArrowRight"
inline const char* lane_name(Lane lane) {
  static const char* names[] = {"ArrowUp", "ArrowDown", "ArrowLeft", "ArrowRight"};
  return names[static_cast<int>(lane)];
}

/// @brief Returns true for lanes of the strong pair.
inline bool is_strong_lane(Lane lane) { return lane == Lane::Up || lane == Lane::Down; }

/// @brief Returns the name of a difficulty.
/// @param d Difficulty
/// @return "easy", "medium" or "hard"
inline const char* difficulty_name(Difficulty d) {
  static const char* names[] = {"easy", "medium", "hard"};
  return names[static_cast<int>(d)];
}

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::InvalidFormat:
      return "Invalid format";
    case ErrorCode::DecodeFailed:
      return "Decode failed";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::OutOfMemory:
      return "Out of memory";
  }
  return "Unknown error";
}

}  // namespace notechart
