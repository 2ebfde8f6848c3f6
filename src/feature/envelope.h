#pragma once

/// @file envelope.h
/// @brief Frame-wise RMS energy envelope.

#include <cstddef>
#include <vector>

#include "core/audio.h"

namespace notechart {

/// @brief Configuration for envelope extraction.
/// @details 1024/512 gives ~23 ms frames with 50% overlap at 44.1 kHz.
struct EnvelopeConfig {
  int window_length = 1024;  ///< Frame length in samples
  int hop_length = 512;      ///< Frame stride in samples (must not exceed window_length)
};

/// @brief Returns the number of full frames that fit in a buffer.
/// @param n_samples Buffer length
/// @param window_length Frame length
/// @param hop_length Frame stride
/// @return Frame count (0 if the buffer is shorter than one window)
size_t frame_count(size_t n_samples, int window_length, int hop_length);

/// @brief Converts a frame index to its start time in seconds.
/// @param frame Frame index
/// @param hop_length Frame stride in samples
/// @param sr Sample rate in Hz
double frame_to_time(int frame, int hop_length, int sr);

/// @brief Computes the RMS envelope of a sample buffer.
/// @details Frame k covers samples [k * hop, k * hop + window). Frames are emitted
/// while a full window fits. Each value is sqrt(mean(x^2)) over the frame.
/// @param samples Pointer to samples
/// @param size Number of samples
/// @param config Envelope configuration
/// @return Envelope [n_frames]; empty if the buffer is shorter than one window
/// @throws NotechartException on invalid window or hop
std::vector<float> compute_rms_envelope(const float* samples, size_t size,
                                        const EnvelopeConfig& config = EnvelopeConfig());

/// @brief Computes the RMS envelope of an Audio buffer.
/// @param audio Input audio
/// @param config Envelope configuration
/// @return Envelope [n_frames]
std::vector<float> compute_rms_envelope(const Audio& audio,
                                        const EnvelopeConfig& config = EnvelopeConfig());

}  // namespace notechart
