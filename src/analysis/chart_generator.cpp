#include "analysis/chart_generator.h"

#include "analysis/quantizer.h"
#include "util/exception.h"

namespace notechart {

ChartConfig ChartConfig::for_difficulty(Difficulty difficulty) {
  DifficultyProfile profile = difficulty_profile(difficulty);

  ChartConfig config;
  config.difficulty = difficulty;
  config.pick.sensitivity = profile.sensitivity;
  config.assign.min_separation = profile.min_separation;
  config.subdivisions = profile.subdivisions;
  return config;
}

ChartGenerator::ChartGenerator(const Audio& audio, const ChartConfig& config)
    : audio_(audio), config_(config), progress_callback_(nullptr) {
  NOTECHART_CHECK_MSG(!audio.empty(), ErrorCode::InvalidParameter, "Audio buffer is empty");
  NOTECHART_CHECK_MSG(audio.sample_rate() > 0, ErrorCode::InvalidParameter,
                      "Sample rate must be positive");
}

ChartGenerator::ChartGenerator(const Audio& audio, Difficulty difficulty)
    : ChartGenerator(audio, ChartConfig::for_difficulty(difficulty)) {}

void ChartGenerator::set_progress_callback(ProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

void ChartGenerator::report_progress(float progress, const char* stage) {
  if (progress_callback_) {
    progress_callback_(progress, stage);
  }
}

const std::vector<float>& ChartGenerator::envelope() {
  if (!envelope_) {
    envelope_ =
        std::make_unique<std::vector<float>>(compute_rms_envelope(audio_, config_.envelope));
  }
  return *envelope_;
}

const std::vector<float>& ChartGenerator::onset_curve() {
  if (!onset_curve_) {
    onset_curve_ = std::make_unique<std::vector<float>>(
        compute_onset_curve(envelope(), config_.onset_curve));
  }
  return *onset_curve_;
}

OnsetPicker& ChartGenerator::onset_picker() {
  if (!onset_picker_) {
    onset_picker_ = std::make_unique<OnsetPicker>(onset_curve(), envelope(), audio_.sample_rate(),
                                                  config_.envelope.hop_length, config_.pick);
  }
  return *onset_picker_;
}

TempoEstimator& ChartGenerator::tempo_estimator() {
  if (!tempo_estimator_) {
    tempo_estimator_ =
        std::make_unique<TempoEstimator>(onset_picker().candidates(), config_.tempo);
  }
  return *tempo_estimator_;
}

const std::vector<OnsetCandidate>& ChartGenerator::quantized() {
  if (!quantized_) {
    quantized_ = std::make_unique<std::vector<OnsetCandidate>>(quantize_onsets(
        onset_picker().candidates(), tempo_estimator().beat_period(), config_.subdivisions));
  }
  return *quantized_;
}

NoteAssigner& ChartGenerator::note_assigner() {
  if (!note_assigner_) {
    note_assigner_ = std::make_unique<NoteAssigner>(quantized(), config_.assign);
  }
  return *note_assigner_;
}

const std::vector<NoteEvent>& ChartGenerator::notes() { return note_assigner().notes(); }

ChartResult ChartGenerator::generate() {
  ChartResult result;
  result.difficulty = config_.difficulty;

  report_progress(0.0f, "envelope");
  result.envelope = envelope();

  report_progress(0.2f, "onset_curve");
  result.onset_curve = onset_curve();

  report_progress(0.35f, "onsets");
  result.candidates = onset_picker().candidates();

  report_progress(0.55f, "tempo");
  result.tempo = tempo_estimator().estimate();

  report_progress(0.7f, "quantize");
  result.quantized = quantized();

  report_progress(0.85f, "notes");
  result.strength_threshold = note_assigner().threshold();
  result.notes = note_assigner().notes();

  report_progress(1.0f, "complete");

  return result;
}

std::vector<NoteEvent> generate_chart(const Audio& audio, Difficulty difficulty) {
  ChartGenerator generator(audio, difficulty);
  return generator.notes();
}

std::vector<NoteEvent> generate_chart(const Audio& audio, const ChartConfig& config) {
  ChartGenerator generator(audio, config);
  return generator.notes();
}

}  // namespace notechart
