#include "core/audio.h"

#include <Eigen/Core>
#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace notechart {

Audio::Audio(std::shared_ptr<const std::vector<float>> storage, const float* begin, size_t size,
             int sample_rate)
    : storage_(std::move(storage)), begin_(begin), size_(size), sample_rate_(sample_rate) {}

Audio Audio::own(std::vector<float> samples, int sample_rate) {
  NOTECHART_CHECK_MSG(sample_rate > 0, ErrorCode::InvalidParameter,
                      "Sample rate must be positive");
  auto storage = std::make_shared<const std::vector<float>>(std::move(samples));
  return Audio(storage, storage->data(), storage->size(), sample_rate);
}

Audio Audio::from_buffer(const float* samples, size_t size, int sample_rate) {
  NOTECHART_CHECK(samples != nullptr || size == 0, ErrorCode::InvalidParameter);
  if (size == 0) return own({}, sample_rate);
  return own(std::vector<float>(samples, samples + size), sample_rate);
}

Audio Audio::from_vector(std::vector<float> samples, int sample_rate) {
  return own(std::move(samples), sample_rate);
}

Audio Audio::from_interleaved(const float* interleaved, size_t n_frames, int channels,
                              int sample_rate) {
  NOTECHART_CHECK(channels >= 1, ErrorCode::InvalidParameter);
  NOTECHART_CHECK(interleaved != nullptr || n_frames == 0, ErrorCode::InvalidParameter);
  if (n_frames == 0) return own({}, sample_rate);

  // Column 0 of a row-major [n_frames x channels] matrix
  Eigen::Map<const Eigen::ArrayXf, 0, Eigen::InnerStride<>> first(
      interleaved, static_cast<Eigen::Index>(n_frames), Eigen::InnerStride<>(channels));
  std::vector<float> mono(n_frames);
  Eigen::Map<Eigen::ArrayXf>(mono.data(), static_cast<Eigen::Index>(n_frames)) = first;
  return own(std::move(mono), sample_rate);
}

Audio Audio::from_file(const std::string& path, const AudioLoadOptions& options) {
  auto [samples, sample_rate] = load_audio(path, options);
  return own(std::move(samples), sample_rate);
}

Audio Audio::from_memory(const uint8_t* data, size_t size, const AudioLoadOptions& options) {
  auto [samples, sample_rate] = load_buffer(data, size, options);
  return own(std::move(samples), sample_rate);
}

double Audio::duration() const {
  if (sample_rate_ <= 0) return 0.0;
  return static_cast<double>(size_) / sample_rate_;
}

float Audio::peak() const {
  if (empty()) return 0.0f;
  return Eigen::Map<const Eigen::ArrayXf>(begin_, static_cast<Eigen::Index>(size_))
      .abs()
      .maxCoeff();
}

float Audio::rms() const {
  if (empty()) return 0.0f;
  double mean_square = Eigen::Map<const Eigen::ArrayXf>(begin_, static_cast<Eigen::Index>(size_))
                           .cast<double>()
                           .square()
                           .mean();
  return static_cast<float>(std::sqrt(mean_square));
}

Audio Audio::slice(double start_time, double end_time) const {
  if (sample_rate_ <= 0) return Audio();

  auto to_index = [this](double t) {
    double index = std::floor(std::max(0.0, t) * sample_rate_);
    return index >= static_cast<double>(size_) ? size_ : static_cast<size_t>(index);
  };

  size_t first = to_index(start_time);
  size_t last = end_time < 0.0 ? size_ : to_index(end_time);
  if (first >= last) {
    return Audio(storage_, begin_ + first, 0, sample_rate_);
  }
  return Audio(storage_, begin_ + first, last - first, sample_rate_);
}

}  // namespace notechart
