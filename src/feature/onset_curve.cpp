#include "feature/onset_curve.h"

#include <algorithm>

#include "util/exception.h"

namespace notechart {

std::vector<float> rectified_difference(const std::vector<float>& envelope) {
  std::vector<float> diff(envelope.size(), 0.0f);
  for (size_t i = 1; i < envelope.size(); ++i) {
    diff[i] = std::max(0.0f, envelope[i] - envelope[i - 1]);
  }
  return diff;
}

std::vector<float> moving_average(const std::vector<float>& data, int width) {
  NOTECHART_CHECK_MSG(width >= 1 && width % 2 == 1, ErrorCode::InvalidParameter,
                      "Smoothing width must be odd and positive");

  int n = static_cast<int>(data.size());
  int half = width / 2;
  std::vector<float> smoothed(data.size(), 0.0f);

  for (int i = 0; i < n; ++i) {
    int lo = std::max(0, i - half);
    int hi = std::min(n - 1, i + half);
    float sum = 0.0f;
    for (int j = lo; j <= hi; ++j) {
      sum += data[j];
    }
    smoothed[i] = sum / static_cast<float>(hi - lo + 1);
  }

  return smoothed;
}

std::vector<float> compute_onset_curve(const std::vector<float>& envelope,
                                       const OnsetCurveConfig& config) {
  return moving_average(rectified_difference(envelope), config.smooth_width);
}

}  // namespace notechart
