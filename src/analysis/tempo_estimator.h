#pragma once

/// @file tempo_estimator.h
/// @brief Beat period estimation from inter-onset-interval statistics.
///
/// @section tempo_algorithm Algorithm Overview
///
/// 1. Inter-onset intervals (IOIs) are taken between consecutive candidates.
/// 2. A fixed-bin histogram spans [min IOI, max IOI]; the center of the modal
///    bin is the raw dominant interval.
/// 3. Octave folding brings the interval into the configured BPM band: halve
///    while slower than bpm_min, or double while faster than bpm_max. Only the
///    direction of the bound that was originally violated is applied.
/// 4. If no interval was found, or the folded period is non-finite or outside
///    [min_period, max_period], the default period is used.
///
/// The estimator never fails: it always yields a usable beat period.

#include <vector>

#include "analysis/onset_picker.h"

namespace notechart {

/// @brief Configuration for tempo estimation.
struct TempoConfig {
  double bpm_min = 60.0;         ///< Lower edge of the tempo band
  double bpm_max = 200.0;        ///< Upper edge of the tempo band
  int histogram_bins = 50;       ///< IOI histogram bin count
  double min_period = 0.1;       ///< Shortest acceptable beat period (seconds)
  double max_period = 2.0;       ///< Longest acceptable beat period (seconds)
  double default_period = 0.5;   ///< Fallback beat period (120 BPM)
};

/// @brief IOI histogram over [min_interval, min_interval + bin_width * counts.size()].
struct IoiHistogram {
  double min_interval = 0.0;
  double bin_width = 0.0;
  std::vector<int> counts;  ///< Empty if all intervals are identical or none exist

  bool empty() const { return counts.empty(); }

  /// @brief Returns the center time of a bin.
  double bin_center(int bin) const { return min_interval + (bin + 0.5) * bin_width; }
};

/// @brief Result of tempo estimation.
struct TempoEstimate {
  double beat_period;   ///< Beat period in seconds
  double bpm;           ///< 60 / beat_period
  double raw_interval;  ///< Modal IOI before folding (0 if none)
  bool fallback;       ///< True if the default period was used
};

/// @brief Computes intervals between consecutive candidates.
/// @param candidates Candidates, time ascending
/// @return n-1 intervals for n candidates
std::vector<double> inter_onset_intervals(const std::vector<OnsetCandidate>& candidates);

/// @brief Builds a fixed-bin IOI histogram.
/// @details Each interval goes to bin floor((ioi - min) / width). An interval
/// whose index equals the bin count (the maximum landing exactly on the upper
/// edge) is not counted. Returns an empty histogram when width is zero.
/// @param intervals Inter-onset intervals
/// @param n_bins Bin count (> 0)
/// @return Histogram
IoiHistogram build_ioi_histogram(const std::vector<double>& intervals, int n_bins);

/// @brief Folds a period into the tempo band by octave steps.
/// @param period Raw period in seconds
/// @param config Tempo configuration
/// @return Folded period (unchanged if already inside the band)
double fold_octave(double period, const TempoConfig& config);

/// @brief Beat period estimator from onset candidates.
class TempoEstimator {
 public:
  /// @brief Estimates the beat period.
  /// @param candidates Candidates, time ascending
  /// @param config Tempo configuration
  explicit TempoEstimator(const std::vector<OnsetCandidate>& candidates,
                          const TempoConfig& config = TempoConfig());

  /// @brief Returns the beat period in seconds.
  double beat_period() const { return estimate_.beat_period; }

  /// @brief Returns the tempo in BPM.
  double bpm() const { return estimate_.bpm; }

  /// @brief Returns the modal interval before folding (0 if none).
  double raw_interval() const { return estimate_.raw_interval; }

  /// @brief Returns true if the default period was used.
  bool used_fallback() const { return estimate_.fallback; }

  /// @brief Returns the full estimate.
  const TempoEstimate& estimate() const { return estimate_; }

  /// @brief Returns the inter-onset intervals.
  const std::vector<double>& intervals() const { return intervals_; }

  /// @brief Returns the IOI histogram.
  const IoiHistogram& histogram() const { return histogram_; }

 private:
  void analyze();

  TempoEstimate estimate_;
  std::vector<double> intervals_;
  IoiHistogram histogram_;
  TempoConfig config_;
};

/// @brief Quick beat period estimation.
/// @param candidates Candidates, time ascending
/// @param config Tempo configuration
/// @return Beat period in seconds
double estimate_beat_period(const std::vector<OnsetCandidate>& candidates,
                           const TempoConfig& config = TempoConfig());

}  // namespace notechart
