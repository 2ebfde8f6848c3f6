#pragma once

/// @file difficulty.h
/// @brief Difficulty profiles controlling note density and grid resolution.

#include <string>
#include <vector>

#include "util/types.h"

namespace notechart {

/// @brief Per-difficulty configuration bundle.
/// @details Selected once per chart and never modified during analysis.
///
/// `sensitivity` multiplies the onset-curve standard deviation when forming
/// the peak threshold (threshold = mean + stddev * sensitivity). A higher
/// value therefore raises the threshold and detects fewer onsets.
struct DifficultyProfile {
  Difficulty difficulty;
  double min_separation;             ///< Minimum gap between notes (seconds)
  float sensitivity;                 ///< Onset threshold multiplier
  std::vector<double> subdivisions;  ///< Grid subdivisions as fractions of a beat
};

/// @brief Returns the profile for a difficulty.
/// @details
/// | Difficulty | min_separation | sensitivity | subdivisions          |
/// |------------|----------------|-------------|-----------------------|
/// | Easy       | 0.30 s         | 0.5         | {1, 0.5}              |
/// | Medium     | 0.15 s         | 0.8         | {1, 0.5, 0.25}        |
/// | Hard       | 0.08 s         | 1.2         | {1, 0.5, 0.25, 0.125} |
/// @param difficulty Difficulty selector
/// @return Difficulty profile
DifficultyProfile difficulty_profile(Difficulty difficulty);

/// @brief Parses a difficulty name ("easy", "medium", "hard"; case-insensitive).
/// @param name Difficulty name
/// @return Difficulty
/// @throws NotechartException with InvalidParameter for any other name
Difficulty parse_difficulty(const std::string& name);

}  // namespace notechart
