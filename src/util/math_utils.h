#pragma once

/// @file math_utils.h
/// @brief Mathematical utility functions for signal processing.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace notechart {

/// @brief Returns the index of the maximum element.
/// @details Ties resolve to the earliest index.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Index of maximum element (0 if empty)
template <typename T>
size_t argmax(const T* data, size_t size) {
  if (size == 0) return 0;
  return std::distance(data, std::max_element(data, data + size));
}

/// @brief Computes the arithmetic mean.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean value (0 if empty)
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Computes the population variance.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Variance (0 if size < 2)
template <typename T>
T variance(const T* data, size_t size) {
  if (size < 2) return T{0};
  T m = mean(data, size);
  T sum_sq = T{0};
  for (size_t i = 0; i < size; ++i) {
    T diff = data[i] - m;
    sum_sq += diff * diff;
  }
  return sum_sq / static_cast<T>(size);
}

/// @brief Computes the standard deviation.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Standard deviation
template <typename T>
T stddev(const T* data, size_t size) {
  return std::sqrt(variance(data, size));
}

/// @brief Rounds to the nearest integer, halves toward positive infinity.
/// @details -2.5 rounds to -2 and 2.5 rounds to 3, unlike std::round.
inline double round_half_up(double value) { return std::floor(value + 0.5); }

/// @brief Computes the nearest-rank percentile without interpolation.
/// @details Returns sorted[floor(size * fraction)], clamped to the last element.
/// @param data Pointer to data array
/// @param size Number of elements
/// @param fraction Percentile as a fraction in [0, 1]
/// @return Percentile value (0 if empty)
float rank_percentile(const float* data, size_t size, float fraction);

/// @brief Collects the strictly positive values of an array.
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Positive values in original order
std::vector<float> positive_values(const float* data, size_t size);

}  // namespace notechart
