#pragma once

/// @file chart_generator.h
/// @brief Audio-to-chart pipeline facade.
///
/// Stages, in order:
/// 1. RMS envelope (feature/envelope.h)
/// 2. Smoothed onset curve (feature/onset_curve.h)
/// 3. Onset picking (analysis/onset_picker.h)
/// 4. Beat period estimation (analysis/tempo_estimator.h)
/// 5. Grid quantization (analysis/quantizer.h)
/// 6. Lane assignment, de-duplication and spacing (analysis/note_assigner.h)

#include <functional>
#include <memory>
#include <vector>

#include "analysis/difficulty.h"
#include "analysis/note_assigner.h"
#include "analysis/onset_picker.h"
#include "analysis/tempo_estimator.h"
#include "core/audio.h"
#include "feature/envelope.h"
#include "feature/onset_curve.h"

namespace notechart {

/// @brief Progress callback type for analysis progress reporting.
/// @param progress Progress value (0.0 to 1.0)
/// @param stage Current stage name
using ProgressCallback = std::function<void(float progress, const char* stage)>;

/// @brief Full pipeline configuration.
struct ChartConfig {
  Difficulty difficulty = Difficulty::Medium;
  EnvelopeConfig envelope;
  OnsetCurveConfig onset_curve;
  OnsetPickConfig pick;
  TempoConfig tempo;
  AssignConfig assign;
  std::vector<double> subdivisions = {1.0, 0.5, 0.25};  ///< Quantization grid

  /// @brief Builds the configuration for a difficulty profile.
  /// @details Copies min_separation, sensitivity and subdivisions from the
  /// profile; all other fields keep their defaults.
  static ChartConfig for_difficulty(Difficulty difficulty);
};

/// @brief Complete chart generation result with intermediate data.
struct ChartResult {
  Difficulty difficulty;
  std::vector<float> envelope;             ///< RMS envelope
  std::vector<float> onset_curve;          ///< Smoothed onset curve
  std::vector<OnsetCandidate> candidates;  ///< Picked onsets
  TempoEstimate tempo;                     ///< Beat period estimate
  std::vector<OnsetCandidate> quantized;   ///< Grid-aligned onsets
  float strength_threshold;                ///< Strong/weak split
  std::vector<NoteEvent> notes;            ///< Final chart
};

/// @brief Chart generation facade.
/// @details Each stage is computed on first access and cached, so intermediate
/// results can be inspected without re-running earlier stages.
class ChartGenerator {
 public:
  /// @brief Constructs a generator.
  /// @param audio Input audio (mono)
  /// @param config Pipeline configuration
  /// @throws NotechartException if audio is empty or its sample rate is not positive
  explicit ChartGenerator(const Audio& audio, const ChartConfig& config = ChartConfig());

  /// @brief Constructs a generator with the profile of a difficulty.
  ChartGenerator(const Audio& audio, Difficulty difficulty);

  /// @brief Sets progress callback for stage reporting.
  /// @param callback Callback function receiving (progress, stage) parameters
  void set_progress_callback(ProgressCallback callback);

  /// @brief Returns the RMS envelope.
  const std::vector<float>& envelope();

  /// @brief Returns the smoothed onset curve.
  const std::vector<float>& onset_curve();

  /// @brief Returns the onset picker.
  OnsetPicker& onset_picker();

  /// @brief Returns the tempo estimator.
  TempoEstimator& tempo_estimator();

  /// @brief Returns grid-aligned onsets.
  const std::vector<OnsetCandidate>& quantized();

  /// @brief Returns the note assigner.
  NoteAssigner& note_assigner();

  /// @brief Returns the final chart notes.
  const std::vector<NoteEvent>& notes();

  /// @brief Runs every stage and returns all results.
  ChartResult generate();

  /// @brief Returns the input audio.
  const Audio& audio() const { return audio_; }

  /// @brief Returns the configuration.
  const ChartConfig& config() const { return config_; }

 private:
  void report_progress(float progress, const char* stage);

  Audio audio_;
  ChartConfig config_;
  ProgressCallback progress_callback_;

  std::unique_ptr<std::vector<float>> envelope_;
  std::unique_ptr<std::vector<float>> onset_curve_;
  std::unique_ptr<OnsetPicker> onset_picker_;
  std::unique_ptr<TempoEstimator> tempo_estimator_;
  std::unique_ptr<std::vector<OnsetCandidate>> quantized_;
  std::unique_ptr<NoteAssigner> note_assigner_;
};

/// @brief Generates a chart for one level.
/// @param audio Input audio (mono)
/// @param difficulty Difficulty selector
/// @return Notes, strictly time ascending, spaced by the profile's min_separation
/// @throws NotechartException if audio is empty or its sample rate is not positive
std::vector<NoteEvent> generate_chart(const Audio& audio, Difficulty difficulty);

/// @brief Generates a chart with an explicit configuration.
std::vector<NoteEvent> generate_chart(const Audio& audio, const ChartConfig& config);

}  // namespace notechart
