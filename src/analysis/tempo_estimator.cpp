#include "analysis/tempo_estimator.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"
#include "util/math_utils.h"

namespace notechart {

std::vector<double> inter_onset_intervals(const std::vector<OnsetCandidate>& candidates) {
  std::vector<double> intervals;
  if (candidates.size() < 2) return intervals;

  intervals.reserve(candidates.size() - 1);
  for (size_t i = 1; i < candidates.size(); ++i) {
    intervals.push_back(candidates[i].time - candidates[i - 1].time);
  }
  return intervals;
}

IoiHistogram build_ioi_histogram(const std::vector<double>& intervals, int n_bins) {
  NOTECHART_CHECK(n_bins > 0, ErrorCode::InvalidParameter);

  IoiHistogram hist;
  if (intervals.empty()) return hist;

  auto [min_it, max_it] = std::minmax_element(intervals.begin(), intervals.end());
  double width = (*max_it - *min_it) / n_bins;
  if (!(width > 0.0)) return hist;

  hist.min_interval = *min_it;
  hist.bin_width = width;
  hist.counts.assign(n_bins, 0);

  for (double ioi : intervals) {
    int bin = static_cast<int>(std::floor((ioi - hist.min_interval) / width));
    if (bin >= 0 && bin < n_bins) {
      hist.counts[bin]++;
    }
  }
  return hist;
}

double fold_octave(double period, const TempoConfig& config) {
  double slowest = 60.0 / config.bpm_min;
  double fastest = 60.0 / config.bpm_max;

  if (period > slowest) {
    while (period > slowest && period > config.min_period) {
      period /= 2.0;
    }
  } else if (period < fastest) {
    while (period < fastest && period < config.max_period) {
      period *= 2.0;
    }
  }
  return period;
}

TempoEstimator::TempoEstimator(const std::vector<OnsetCandidate>& candidates,
                               const TempoConfig& config)
    : estimate_{config.default_period, 60.0 / config.default_period, 0.0, true},
      intervals_(inter_onset_intervals(candidates)),
      config_(config) {
  NOTECHART_CHECK(config.bpm_min > 0.0 && config.bpm_max > config.bpm_min,
                  ErrorCode::InvalidParameter);
  NOTECHART_CHECK(config.default_period > 0.0, ErrorCode::InvalidParameter);
  analyze();
}

void TempoEstimator::analyze() {
  if (intervals_.empty()) return;

  histogram_ = build_ioi_histogram(intervals_, config_.histogram_bins);
  if (histogram_.empty()) return;

  const std::vector<int>& counts = histogram_.counts;
  size_t modal = argmax(counts.data(), counts.size());
  if (counts[modal] == 0) return;

  estimate_.raw_interval = histogram_.bin_center(static_cast<int>(modal));

  double period = fold_octave(estimate_.raw_interval, config_);
  if (period == 0.0 || !std::isfinite(period) || period < config_.min_period ||
      period > config_.max_period) {
    return;
  }

  estimate_.beat_period = period;
  estimate_.bpm = 60.0 / period;
  estimate_.fallback = false;
}

double estimate_beat_period(const std::vector<OnsetCandidate>& candidates,
                           const TempoConfig& config) {
  TempoEstimator estimator(candidates, config);
  return estimator.beat_period();
}

}  // namespace notechart
