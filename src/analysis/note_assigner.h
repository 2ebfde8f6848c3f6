#pragma once

/// @file note_assigner.h
/// @brief Lane assignment, de-duplication and spacing of chart notes.

#include <vector>

#include "analysis/onset_picker.h"
#include "util/types.h"

namespace notechart {

/// @brief Chart note.
struct NoteEvent {
  double time;     ///< Note time in seconds
  Lane lane;       ///< Assigned lane
  float salience;  ///< Onset curve value of the source onset
};

/// @brief Configuration for note assignment.
struct AssignConfig {
  float strong_percentile = 0.6f;  ///< Strength rank splitting weak from strong notes
  double min_separation = 0.15;    ///< Minimum gap between kept notes (seconds)
};

/// @brief Last lane used per pair, threaded through lane assignment.
struct LaneState {
  Lane last_strong = Lane::Up;
  Lane last_weak = Lane::Left;
};

/// @brief Returns the strength at the given rank: sorted[floor(n * percentile)].
/// @param onsets Quantized onsets
/// @param percentile Fraction in [0, 1)
/// @return Strength threshold (0 if empty)
float strength_threshold(const std::vector<OnsetCandidate>& onsets, float percentile);

/// @brief Assigns the next lane for one onset and advances the state.
/// @details Strong onsets alternate Down/Up, weak onsets alternate Right/Left;
/// each pair alternates independently of the other.
/// @param state Lane state (updated)
/// @param strong True if the onset is strong
/// @return Assigned lane
Lane next_lane(LaneState& state, bool strong);

/// @brief Converts quantized onsets to lane-tagged notes.
/// @param onsets Quantized onsets, time ascending
/// @param threshold Strength at or above which an onset is strong
/// @param initial Initial lane state
/// @return Notes in input order
std::vector<NoteEvent> assign_lanes(const std::vector<OnsetCandidate>& onsets, float threshold,
                                    LaneState initial = LaneState());

/// @brief Keeps one note per millisecond bucket.
/// @details Notes whose time rounds to the same millisecond collide; a later note
/// replaces the kept one only with strictly greater salience. Output is sorted by
/// time.
/// @param notes Notes
/// @return De-duplicated notes, time ascending
std::vector<NoteEvent> deduplicate_notes(const std::vector<NoteEvent>& notes);

/// @brief Slack allowed when comparing a gap against the minimum separation.
/// @details Grid points are origin + k * step, so two lines exactly
/// min_separation apart can differ by a few ulps less than min_separation.
constexpr double kSeparationTolerance = 1e-9;

/// @brief Greedy forward spacing filter.
/// @details Keeps the first note, then each note at least min_separation after
/// the last kept note. Gaps short of min_separation by no more than
/// kSeparationTolerance count as equal.
/// @param notes Notes, time ascending
/// @param min_separation Minimum gap in seconds
/// @return Filtered notes
std::vector<NoteEvent> enforce_min_separation(const std::vector<NoteEvent>& notes,
                                              double min_separation);

/// @brief Runs lane assignment, de-duplication and spacing in order.
class NoteAssigner {
 public:
  /// @brief Builds the final notes from quantized onsets.
  /// @param onsets Quantized onsets, time ascending
  /// @param config Assignment configuration
  explicit NoteAssigner(const std::vector<OnsetCandidate>& onsets,
                        const AssignConfig& config = AssignConfig());

  /// @brief Returns the final notes.
  const std::vector<NoteEvent>& notes() const { return notes_; }

  /// @brief Returns notes after lane assignment, before de-duplication.
  const std::vector<NoteEvent>& assigned() const { return assigned_; }

  /// @brief Returns notes after de-duplication, before spacing.
  const std::vector<NoteEvent>& deduplicated() const { return deduplicated_; }

  /// @brief Returns the strong/weak strength threshold.
  float threshold() const { return threshold_; }

 private:
  std::vector<NoteEvent> notes_;
  std::vector<NoteEvent> assigned_;
  std::vector<NoteEvent> deduplicated_;
  float threshold_;
};

}  // namespace notechart
