#include "analysis/note_assigner.h"

#include <algorithm>
#include <cstdint>
#include <map>

#include "util/exception.h"
#include "util/math_utils.h"

namespace notechart {

float strength_threshold(const std::vector<OnsetCandidate>& onsets, float percentile) {
  std::vector<float> strengths;
  strengths.reserve(onsets.size());
  for (const auto& onset : onsets) {
    strengths.push_back(onset.strength);
  }
  return rank_percentile(strengths.data(), strengths.size(), percentile);
}

Lane next_lane(LaneState& state, bool strong) {
  if (strong) {
    state.last_strong = state.last_strong == Lane::Up ? Lane::Down : Lane::Up;
    return state.last_strong;
  }
  state.last_weak = state.last_weak == Lane::Left ? Lane::Right : Lane::Left;
  return state.last_weak;
}

std::vector<NoteEvent> assign_lanes(const std::vector<OnsetCandidate>& onsets, float threshold,
                                    LaneState initial) {
  std::vector<NoteEvent> notes;
  notes.reserve(onsets.size());

  LaneState state = initial;
  for (const auto& onset : onsets) {
    Lane lane = next_lane(state, onset.strength >= threshold);
    notes.push_back({onset.time, lane, onset.salience});
  }
  return notes;
}

std::vector<NoteEvent> deduplicate_notes(const std::vector<NoteEvent>& notes) {
  // Bucket key -> index into kept, so first-seen order survives replacement
  std::map<int64_t, size_t> buckets;
  std::vector<NoteEvent> kept;
  kept.reserve(notes.size());

  for (const auto& note : notes) {
    auto key = static_cast<int64_t>(round_half_up(note.time * 1000.0));
    auto it = buckets.find(key);
    if (it == buckets.end()) {
      buckets.emplace(key, kept.size());
      kept.push_back(note);
    } else if (note.salience > kept[it->second].salience) {
      kept[it->second] = note;
    }
  }

  std::stable_sort(kept.begin(), kept.end(),
                   [](const NoteEvent& a, const NoteEvent& b) { return a.time < b.time; });
  return kept;
}

std::vector<NoteEvent> enforce_min_separation(const std::vector<NoteEvent>& notes,
                                              double min_separation) {
  std::vector<NoteEvent> spaced;
  if (notes.empty()) return spaced;

  spaced.push_back(notes.front());
  for (size_t i = 1; i < notes.size(); ++i) {
    if (notes[i].time - spaced.back().time >= min_separation - kSeparationTolerance) {
      spaced.push_back(notes[i]);
    }
  }
  return spaced;
}

NoteAssigner::NoteAssigner(const std::vector<OnsetCandidate>& onsets, const AssignConfig& config)
    : threshold_(strength_threshold(onsets, config.strong_percentile)) {
  NOTECHART_CHECK(config.strong_percentile >= 0.0f && config.strong_percentile < 1.0f,
                  ErrorCode::InvalidParameter);
  NOTECHART_CHECK(config.min_separation >= 0.0, ErrorCode::InvalidParameter);

  assigned_ = assign_lanes(onsets, threshold_);
  deduplicated_ = deduplicate_notes(assigned_);
  notes_ = enforce_min_separation(deduplicated_, config.min_separation);
}

}  // namespace notechart
