#include "feature/envelope.h"

#include <Eigen/Core>
#include <cmath>

#include "util/exception.h"

namespace notechart {

size_t frame_count(size_t n_samples, int window_length, int hop_length) {
  size_t window = static_cast<size_t>(window_length);
  size_t hop = static_cast<size_t>(hop_length);
  if (n_samples < window) return 0;
  return (n_samples - window) / hop + 1;
}

double frame_to_time(int frame, int hop_length, int sr) {
  return static_cast<double>(frame) * hop_length / sr;
}

std::vector<float> compute_rms_envelope(const float* samples, size_t size,
                                        const EnvelopeConfig& config) {
  NOTECHART_CHECK(config.window_length > 0, ErrorCode::InvalidParameter);
  NOTECHART_CHECK(config.hop_length > 0, ErrorCode::InvalidParameter);
  NOTECHART_CHECK_MSG(config.hop_length <= config.window_length, ErrorCode::InvalidParameter,
                      "hop_length must not exceed window_length");

  if (samples == nullptr || size == 0) {
    return {};
  }

  size_t n_frames = frame_count(size, config.window_length, config.hop_length);
  std::vector<float> envelope(n_frames, 0.0f);

  // Each frame maps a window of the input without copying.
  for (size_t k = 0; k < n_frames; ++k) {
    Eigen::Map<const Eigen::ArrayXf> frame(samples + k * config.hop_length,
                                           config.window_length);
    envelope[k] = std::sqrt(frame.square().mean());
  }

  return envelope;
}

std::vector<float> compute_rms_envelope(const Audio& audio, const EnvelopeConfig& config) {
  return compute_rms_envelope(audio.data(), audio.size(), config);
}

}  // namespace notechart
