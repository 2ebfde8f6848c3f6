#include "analysis/quantizer.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "util/math_utils.h"

namespace notechart {

double snap_to_grid(double time, double origin, double beat_period,
                    const std::vector<double>& subdivisions) {
  double best_time = time;
  double best_error = std::numeric_limits<double>::infinity();

  for (double subdivision : subdivisions) {
    double step = beat_period * subdivision;
    if (step == 0.0) continue;

    double grid_time = round_half_up((time - origin) / step) * step + origin;
    double error = std::abs(time - grid_time);
    if (error < best_error) {
      best_error = error;
      best_time = grid_time;
    }
  }

  return std::max(0.0, best_time);
}

std::vector<OnsetCandidate> quantize_onsets(const std::vector<OnsetCandidate>& candidates,
                                            double beat_period,
                                            const std::vector<double>& subdivisions) {
  std::vector<OnsetCandidate> quantized;
  quantized.reserve(candidates.size());
  if (candidates.empty()) return quantized;

  double origin = candidates.front().time;
  for (const auto& candidate : candidates) {
    OnsetCandidate snapped = candidate;
    snapped.time = snap_to_grid(candidate.time, origin, beat_period, subdivisions);
    quantized.push_back(snapped);
  }
  return quantized;
}

}  // namespace notechart
