#pragma once

/// @file onset_curve.h
/// @brief Onset detection function derived from an energy envelope.

#include <vector>

namespace notechart {

/// @brief Configuration for the onset curve.
struct OnsetCurveConfig {
  int smooth_width = 3;  ///< Centered moving-average width (odd, >= 1)
};

/// @brief Half-wave rectified first difference.
/// @details out[0] = 0, out[i] = max(0, x[i] - x[i-1]). Energy decreases are
/// not onsets.
/// @param envelope Input sequence
/// @return Rectified difference, same length as input
std::vector<float> rectified_difference(const std::vector<float>& envelope);

/// @brief Centered moving average without padding.
/// @details out[i] averages x[j] for j in [i - width/2, i + width/2] that lie
/// inside the sequence, so boundary frames average fewer neighbors.
/// @param data Input sequence
/// @param width Window width (odd, >= 1)
/// @return Smoothed sequence, same length as input
/// @throws NotechartException if width is even or < 1
std::vector<float> moving_average(const std::vector<float>& data, int width);

/// @brief Computes the smoothed onset curve from an RMS envelope.
/// @param envelope RMS envelope [n_frames]
/// @param config Onset curve configuration
/// @return Onset curve [n_frames]
std::vector<float> compute_onset_curve(const std::vector<float>& envelope,
                                       const OnsetCurveConfig& config = OnsetCurveConfig());

}  // namespace notechart
