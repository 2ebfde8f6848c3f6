#pragma once

/// @file quick.h
/// @brief Simple function API for chart generation.
/// @details Provides stateless functions over raw sample buffers.
/// These functions are designed for ease of use and WASM interoperability.

#include <cstddef>
#include <vector>

#include "analysis/chart_generator.h"

namespace notechart {
namespace quick {

/// @brief Generates a chart from audio samples.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @param difficulty Difficulty selector
/// @return Chart notes, time ascending
std::vector<NoteEvent> generate_chart(const float* samples, size_t size, int sample_rate,
                                      Difficulty difficulty = Difficulty::Medium);

/// @brief Detects onset times from audio samples.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @param difficulty Difficulty whose sensitivity is applied
/// @return Onset times in seconds
std::vector<double> detect_onsets(const float* samples, size_t size, int sample_rate,
                                  Difficulty difficulty = Difficulty::Medium);

/// @brief Estimates the beat period from audio samples.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Tempo estimate (always usable)
TempoEstimate estimate_tempo(const float* samples, size_t size, int sample_rate);

/// @brief Runs the full pipeline and returns every intermediate result.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @param difficulty Difficulty selector
/// @return Complete chart result
ChartResult analyze_chart(const float* samples, size_t size, int sample_rate,
                          Difficulty difficulty = Difficulty::Medium);

}  // namespace quick
}  // namespace notechart
