#include "analysis/difficulty.h"

#include <algorithm>
#include <cctype>

#include "util/exception.h"

namespace notechart {

DifficultyProfile difficulty_profile(Difficulty difficulty) {
  switch (difficulty) {
    case Difficulty::Easy:
      return {Difficulty::Easy, 0.3, 0.5f, {1.0, 0.5}};
    case Difficulty::Medium:
      return {Difficulty::Medium, 0.15, 0.8f, {1.0, 0.5, 0.25}};
    case Difficulty::Hard:
      return {Difficulty::Hard, 0.08, 1.2f, {1.0, 0.5, 0.25, 0.125}};
  }
  throw NotechartException(ErrorCode::InvalidParameter, "Unknown difficulty");
}

Difficulty parse_difficulty(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "easy") return Difficulty::Easy;
  if (lower == "medium") return Difficulty::Medium;
  if (lower == "hard") return Difficulty::Hard;

  throw NotechartException(ErrorCode::InvalidParameter, "Unknown difficulty: " + name);
}

}  // namespace notechart
