/// @file quick.cpp
/// @brief Implementation of simple function API.

#include "quick.h"

#include "core/audio.h"

namespace notechart {
namespace quick {

std::vector<NoteEvent> generate_chart(const float* samples, size_t size, int sample_rate,
                                      Difficulty difficulty) {
  Audio audio = Audio::from_buffer(samples, size, sample_rate);
  return notechart::generate_chart(audio, difficulty);
}

std::vector<double> detect_onsets(const float* samples, size_t size, int sample_rate,
                                  Difficulty difficulty) {
  Audio audio = Audio::from_buffer(samples, size, sample_rate);
  ChartGenerator generator(audio, difficulty);
  return generator.onset_picker().onset_times();
}

TempoEstimate estimate_tempo(const float* samples, size_t size, int sample_rate) {
  Audio audio = Audio::from_buffer(samples, size, sample_rate);
  ChartGenerator generator(audio);
  return generator.tempo_estimator().estimate();
}

ChartResult analyze_chart(const float* samples, size_t size, int sample_rate,
                          Difficulty difficulty) {
  Audio audio = Audio::from_buffer(samples, size, sample_rate);
  ChartGenerator generator(audio, difficulty);
  return generator.generate();
}

}  // namespace quick
}  // namespace notechart
