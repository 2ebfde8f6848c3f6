/// @file bindings.cpp
/// @brief Embind bindings for WebAssembly.

#ifdef __EMSCRIPTEN__

#include <emscripten/bind.h>
#include <emscripten/val.h>

#include <string>
#include <vector>

#include "analysis/chart_generator.h"
#include "analysis/difficulty.h"
#include "core/audio.h"
#include "notechart.h"
#include "quick.h"

using namespace emscripten;
using namespace notechart;

// ============================================================================
// Helper functions
// ============================================================================

val vectorToFloat32Array(const std::vector<float>& vec) {
  val result = val::global("Float32Array").new_(vec.size());
  for (size_t i = 0; i < vec.size(); ++i) {
    result.set(i, vec[i]);
  }
  return result;
}

val vectorToFloat64Array(const std::vector<double>& vec) {
  val result = val::global("Float64Array").new_(vec.size());
  for (size_t i = 0; i < vec.size(); ++i) {
    result.set(i, vec[i]);
  }
  return result;
}

/// @brief Converts notes to [{time, key}], the shape the game UI schedules from.
val notesToVal(const std::vector<NoteEvent>& notes) {
  val result = val::array();
  for (const auto& note : notes) {
    val obj = val::object();
    obj.set("time", note.time);
    obj.set("key", std::string(lane_name(note.lane)));
    result.call<void>("push", obj);
  }
  return result;
}

val candidatesToVal(const std::vector<OnsetCandidate>& candidates) {
  val result = val::array();
  for (const auto& c : candidates) {
    val obj = val::object();
    obj.set("time", c.time);
    obj.set("strength", c.strength);
    obj.set("salience", c.salience);
    obj.set("frame", c.frame);
    result.call<void>("push", obj);
  }
  return result;
}

val tempoToVal(const TempoEstimate& tempo) {
  val obj = val::object();
  obj.set("beatPeriod", tempo.beat_period);
  obj.set("bpm", tempo.bpm);
  obj.set("rawInterval", tempo.raw_interval);
  obj.set("fallback", tempo.fallback);
  return obj;
}

/// @brief Converts ChartResult to JavaScript object.
val chartResultToVal(const ChartResult& result) {
  val out = val::object();
  out.set("difficulty", std::string(difficulty_name(result.difficulty)));
  out.set("envelope", vectorToFloat32Array(result.envelope));
  out.set("onsetCurve", vectorToFloat32Array(result.onset_curve));
  out.set("candidates", candidatesToVal(result.candidates));
  out.set("tempo", tempoToVal(result.tempo));
  out.set("quantized", candidatesToVal(result.quantized));
  out.set("strengthThreshold", result.strength_threshold);
  out.set("notes", notesToVal(result.notes));
  return out;
}

// ============================================================================
// Quick API
// ============================================================================

val js_generate_chart(val samples, int sample_rate, std::string difficulty) {
  std::vector<float> data = vecFromJSArray<float>(samples);
  std::vector<NoteEvent> notes = quick::generate_chart(data.data(), data.size(), sample_rate,
                                                       parse_difficulty(difficulty));
  return notesToVal(notes);
}

val js_detect_onsets(val samples, int sample_rate, std::string difficulty) {
  std::vector<float> data = vecFromJSArray<float>(samples);
  std::vector<double> onsets = quick::detect_onsets(data.data(), data.size(), sample_rate,
                                                    parse_difficulty(difficulty));
  return vectorToFloat64Array(onsets);
}

val js_estimate_tempo(val samples, int sample_rate) {
  std::vector<float> data = vecFromJSArray<float>(samples);
  return tempoToVal(quick::estimate_tempo(data.data(), data.size(), sample_rate));
}

val js_analyze_chart(val samples, int sample_rate, std::string difficulty,
                     val progress_callback) {
  std::vector<float> data = vecFromJSArray<float>(samples);

  Audio audio = Audio::from_buffer(data.data(), data.size(), sample_rate);
  ChartGenerator generator(audio, parse_difficulty(difficulty));

  if (!progress_callback.isNull() && !progress_callback.isUndefined()) {
    generator.set_progress_callback([progress_callback](float progress, const char* stage) {
      progress_callback(progress, std::string(stage));
    });
  }

  return chartResultToVal(generator.generate());
}

std::string js_version() { return version(); }

// ============================================================================
// Bindings
// ============================================================================

EMSCRIPTEN_BINDINGS(notechart) {
  enum_<Difficulty>("Difficulty")
      .value("Easy", Difficulty::Easy)
      .value("Medium", Difficulty::Medium)
      .value("Hard", Difficulty::Hard);

  enum_<Lane>("Lane")
      .value("Up", Lane::Up)
      .value("Down", Lane::Down)
      .value("Left", Lane::Left)
      .value("Right", Lane::Right);

  function("generateChart", &js_generate_chart);
  function("detectOnsets", &js_detect_onsets);
  function("estimateTempo", &js_estimate_tempo);
  function("analyzeChart", &js_analyze_chart);
  function("version", &js_version);
}

#endif  // __EMSCRIPTEN__
