#pragma once

/// @file quantizer.h
/// @brief Snaps onsets to a rhythmic grid derived from the beat period.

#include <vector>

#include "analysis/onset_picker.h"

namespace notechart {

/// @brief Snaps a time to the closest grid line across all subdivisions.
/// @details For each subdivision s (in order) the grid step is beat_period * s
/// and the nearest line is origin + round(k) * step. The line with the smallest
/// absolute error wins; an earlier subdivision wins ties. Zero steps are skipped.
/// The result is clamped to be non-negative.
/// @param time Time to snap (seconds)
/// @param origin Grid origin (seconds)
/// @param beat_period Beat period (seconds)
/// @param subdivisions Grid subdivisions as fractions of a beat
/// @return Snapped time (the input time if no subdivision applies)
double snap_to_grid(double time, double origin, double beat_period,
                    const std::vector<double>& subdivisions);

/// @brief Quantizes all candidates on a grid anchored at the first candidate.
/// @details strength, salience and frame are carried through unchanged.
/// @param candidates Candidates, time ascending
/// @param beat_period Beat period (seconds)
/// @param subdivisions Grid subdivisions as fractions of a beat
/// @return Quantized candidates, in input order
std::vector<OnsetCandidate> quantize_onsets(const std::vector<OnsetCandidate>& candidates,
                                            double beat_period,
                                            const std::vector<double>& subdivisions);

}  // namespace notechart
