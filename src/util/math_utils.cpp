/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <vector>

namespace notechart {

float rank_percentile(const float* data, size_t size, float fraction) {
  if (size == 0) return 0.0f;

  std::vector<float> sorted(data, data + size);
  std::sort(sorted.begin(), sorted.end());

  float pos = std::floor(static_cast<float>(size) * std::max(0.0f, fraction));
  size_t idx = std::min(static_cast<size_t>(pos), size - 1);
  return sorted[idx];
}

std::vector<float> positive_values(const float* data, size_t size) {
  std::vector<float> result;
  result.reserve(size);
  std::copy_if(data, data + size, std::back_inserter(result), [](float v) { return v > 0.0f; });
  return result;
}

}  // namespace notechart
