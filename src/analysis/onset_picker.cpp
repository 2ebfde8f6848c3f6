#include "analysis/onset_picker.h"

#include <algorithm>

#include "feature/envelope.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace notechart {

OnsetPicker::OnsetPicker(const std::vector<float>& onset_curve,
                         const std::vector<float>& envelope, int sr, int hop_length,
                         const OnsetPickConfig& config)
    : sr_(sr), hop_length_(hop_length), config_(config) {
  NOTECHART_CHECK(sr > 0, ErrorCode::InvalidParameter);
  NOTECHART_CHECK(hop_length > 0, ErrorCode::InvalidParameter);
  NOTECHART_CHECK_MSG(onset_curve.size() == envelope.size(), ErrorCode::InvalidParameter,
                      "Onset curve and envelope lengths differ");

  std::vector<float> positive = positive_values(onset_curve.data(), onset_curve.size());
  mean_ = notechart::mean(positive.data(), positive.size());
  stddev_ = notechart::stddev(positive.data(), positive.size());
  threshold_ = mean_ + stddev_ * config_.sensitivity;

  detect_peaks(onset_curve, envelope);
  rescue_leading_onset(onset_curve, envelope);

  std::stable_sort(candidates_.begin(), candidates_.end(),
                   [](const OnsetCandidate& a, const OnsetCandidate& b) { return a.time < b.time; });
}

OnsetCandidate OnsetPicker::make_candidate(int frame, const std::vector<float>& onset_curve,
                                           const std::vector<float>& envelope) const {
  return {frame_to_time(frame, hop_length_, sr_), envelope[frame], onset_curve[frame], frame};
}

void OnsetPicker::detect_peaks(const std::vector<float>& onset_curve,
                               const std::vector<float>& envelope) {
  int n_frames = static_cast<int>(onset_curve.size());

  for (int i = 1; i < n_frames - 1; ++i) {
    float current = onset_curve[i];
    if (current > threshold_ && current > onset_curve[i - 1] && current > onset_curve[i + 1]) {
      candidates_.push_back(make_candidate(i, onset_curve, envelope));
    }
  }
}

void OnsetPicker::rescue_leading_onset(const std::vector<float>& onset_curve,
                                       const std::vector<float>& envelope) {
  float loose_threshold = mean_ + stddev_ * config_.rescue_sensitivity;
  auto it = std::find_if(onset_curve.begin(), onset_curve.end(),
                         [loose_threshold](float v) { return v > loose_threshold; });
  if (it == onset_curve.end()) return;

  int frame = static_cast<int>(std::distance(onset_curve.begin(), it));
  double time = frame_to_time(frame, hop_length_, sr_);

  if (candidates_.empty() || candidates_.front().time > time + config_.rescue_min_lead) {
    candidates_.insert(candidates_.begin(), make_candidate(frame, onset_curve, envelope));
    rescued_ = true;
  }
}

std::vector<double> OnsetPicker::onset_times() const {
  std::vector<double> times;
  times.reserve(candidates_.size());
  for (const auto& candidate : candidates_) {
    times.push_back(candidate.time);
  }
  return times;
}

std::vector<OnsetCandidate> pick_onsets(const std::vector<float>& onset_curve,
                                        const std::vector<float>& envelope, int sr,
                                        int hop_length, const OnsetPickConfig& config) {
  OnsetPicker picker(onset_curve, envelope, sr, hop_length, config);
  return picker.candidates();
}

}  // namespace notechart
