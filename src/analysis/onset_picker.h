#pragma once

/// @file onset_picker.h
/// @brief Adaptive-threshold peak picking over an onset curve.

#include <cstddef>
#include <vector>

namespace notechart {

/// @brief Detected onset candidate.
struct OnsetCandidate {
  double time;    ///< Onset time in seconds
  float strength;  ///< RMS envelope value at the onset frame
  float salience;  ///< Onset curve value at the onset frame
  int frame;       ///< Envelope frame index
};

/// @brief Configuration for onset picking.
struct OnsetPickConfig {
  /// @brief Threshold multiplier: threshold = mean + stddev * sensitivity.
  /// @details Higher values raise the threshold (fewer onsets).
  float sensitivity = 0.8f;
  float rescue_sensitivity = 0.1f;  ///< Multiplier for the leading-onset threshold
  double rescue_min_lead = 0.1;     ///< Seconds the rescued onset must precede the first peak
};

/// @brief Picks onsets as strict local maxima above an adaptive threshold.
/// @details Statistics are computed over strictly positive curve values only, so
/// long silent stretches do not pull the threshold toward zero. A leading-onset
/// rescue prepends the first point above a much looser threshold when it comes
/// well before the first detected peak (or no peak was found).
class OnsetPicker {
 public:
  /// @brief Picks onsets from a precomputed onset curve.
  /// @param onset_curve Smoothed onset curve [n_frames]
  /// @param envelope RMS envelope [n_frames]
  /// @param sr Sample rate in Hz
  /// @param hop_length Envelope hop length in samples
  /// @param config Picking configuration
  /// @throws NotechartException if lengths differ or sr/hop_length are not positive
  OnsetPicker(const std::vector<float>& onset_curve, const std::vector<float>& envelope, int sr,
              int hop_length, const OnsetPickConfig& config = OnsetPickConfig());

  /// @brief Returns candidates, time ascending.
  const std::vector<OnsetCandidate>& candidates() const { return candidates_; }

  /// @brief Returns candidate times in seconds.
  std::vector<double> onset_times() const;

  /// @brief Returns the number of candidates.
  size_t count() const { return candidates_.size(); }

  /// @brief Returns the peak threshold that was applied.
  float threshold() const { return threshold_; }

  /// @brief Returns the mean of positive curve values.
  float mean() const { return mean_; }

  /// @brief Returns the standard deviation of positive curve values.
  float stddev() const { return stddev_; }

  /// @brief Returns true if the leading-onset rescue added a candidate.
  bool rescued() const { return rescued_; }

 private:
  void detect_peaks(const std::vector<float>& onset_curve, const std::vector<float>& envelope);
  void rescue_leading_onset(const std::vector<float>& onset_curve,
                            const std::vector<float>& envelope);
  OnsetCandidate make_candidate(int frame, const std::vector<float>& onset_curve,
                                const std::vector<float>& envelope) const;

  std::vector<OnsetCandidate> candidates_;
  float threshold_ = 0.0f;
  float mean_ = 0.0f;
  float stddev_ = 0.0f;
  bool rescued_ = false;
  int sr_;
  int hop_length_;
  OnsetPickConfig config_;
};

/// @brief Quick onset picking function.
/// @param onset_curve Smoothed onset curve
/// @param envelope RMS envelope
/// @param sr Sample rate in Hz
/// @param hop_length Envelope hop length in samples
/// @param config Picking configuration
/// @return Candidates, time ascending
std::vector<OnsetCandidate> pick_onsets(const std::vector<float>& onset_curve,
                                        const std::vector<float>& envelope, int sr,
                                        int hop_length,
                                        const OnsetPickConfig& config = OnsetPickConfig());

}  // namespace notechart
