#pragma once

/// @file audio.h
/// @brief Mono sample buffer consumed by the chart pipeline.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/audio_io.h"

namespace notechart {

/// @brief Mono float samples with a positive sample rate.
/// @details Every factory validates the sample rate and reduces multi-channel
/// input to its first channel, so analysis code can rely on a single channel.
/// A default-constructed buffer is the only one with sample rate 0.
///
/// The samples live in reference-counted storage; slice() returns a view into
/// the same storage.
class Audio {
 public:
  Audio() = default;

  /// @brief Copies mono samples.
  /// @throws NotechartException if sample_rate <= 0, or samples is null with size > 0
  static Audio from_buffer(const float* samples, size_t size, int sample_rate);

  /// @brief Takes ownership of mono samples.
  /// @throws NotechartException if sample_rate <= 0
  static Audio from_vector(std::vector<float> samples, int sample_rate);

  /// @brief Keeps the first channel of interleaved samples.
  /// @param interleaved Samples ordered frame by frame, channel by channel
  /// @param n_frames Number of frames (samples per channel)
  /// @param channels Channel count (>= 1)
  /// @param sample_rate Sample rate in Hz
  /// @throws NotechartException on a null pointer, channels < 1 or sample_rate <= 0
  static Audio from_interleaved(const float* interleaved, size_t n_frames, int channels,
                                int sample_rate);

  /// @brief Decodes a WAV or MP3 file.
  /// @details options.mixdown selects first-channel (default) or averaged reduction.
  /// @throws NotechartException on file not found or decode error
  static Audio from_file(const std::string& path,
                         const AudioLoadOptions& options = kDefaultLoadOptions);

  /// @brief Decodes a WAV or MP3 image held in memory.
  /// @throws NotechartException on decode error
  static Audio from_memory(const uint8_t* data, size_t size,
                           const AudioLoadOptions& options = kDefaultLoadOptions);

  const float* data() const { return begin_; }
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  int sample_rate() const { return sample_rate_; }

  /// @brief Returns the length in seconds.
  double duration() const;

  /// @brief Returns the largest absolute sample value (0 if empty).
  float peak() const;

  /// @brief Returns the root-mean-square level over all samples (0 if empty).
  float rms() const;

  /// @brief Returns a view of [start_time, end_time) in seconds.
  /// @details Times are clamped to the buffer. A negative end_time means the
  /// end of the buffer. An empty range yields an empty buffer that keeps the
  /// sample rate.
  Audio slice(double start_time, double end_time = -1.0) const;

 private:
  Audio(std::shared_ptr<const std::vector<float>> storage, const float* begin, size_t size,
        int sample_rate);

  static Audio own(std::vector<float> samples, int sample_rate);

  std::shared_ptr<const std::vector<float>> storage_;
  const float* begin_ = nullptr;
  size_t size_ = 0;
  int sample_rate_ = 0;
};

}  // namespace notechart
