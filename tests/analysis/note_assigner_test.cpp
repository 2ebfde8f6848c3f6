/// @file note_assigner_test.cpp
/// @brief Tests for lane assignment, de-duplication and spacing.

#include "analysis/note_assigner.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "analysis/quantizer.h"
#include "util/exception.h"

using namespace notechart;
using Catch::Matchers::WithinAbs;

namespace {

OnsetCandidate onset(double time, float strength, float salience = 0.1f) {
  return {time, strength, salience, 0};
}

NoteEvent note(double time, float salience, Lane lane = Lane::Up) {
  return {time, lane, salience};
}

}  // namespace

TEST_CASE("strength_threshold uses nearest rank", "[note_assigner]") {
  std::vector<OnsetCandidate> onsets = {onset(0.0, 0.1f), onset(0.5, 0.5f), onset(1.0, 0.3f),
                                        onset(1.5, 0.9f), onset(2.0, 0.7f)};
  REQUIRE(strength_threshold(onsets, 0.6f) == 0.7f);
  REQUIRE(strength_threshold({}, 0.6f) == 0.0f);
}

TEST_CASE("next_lane alternates each pair independently", "[note_assigner]") {
  LaneState state;

  REQUIRE(next_lane(state, true) == Lane::Down);
  REQUIRE(next_lane(state, false) == Lane::Right);
  REQUIRE(next_lane(state, true) == Lane::Up);
  REQUIRE(next_lane(state, true) == Lane::Down);
  REQUIRE(next_lane(state, false) == Lane::Left);
  REQUIRE(next_lane(state, false) == Lane::Right);
}

TEST_CASE("assign_lanes splits strong and weak", "[note_assigner]") {
  std::vector<OnsetCandidate> onsets = {onset(0.0, 0.9f, 0.4f), onset(0.5, 0.2f),
                                        onset(1.0, 0.8f), onset(1.5, 0.5f)};
  auto notes = assign_lanes(onsets, 0.8f);

  REQUIRE(notes.size() == 4);
  REQUIRE(notes[0].lane == Lane::Down);
  REQUIRE(notes[1].lane == Lane::Right);
  REQUIRE(notes[2].lane == Lane::Up);  // at threshold counts as strong
  REQUIRE(notes[3].lane == Lane::Left);
  REQUIRE(notes[0].salience == 0.4f);
  REQUIRE(notes[2].time == 1.0);
}

TEST_CASE("deduplicate_notes keeps highest salience per millisecond", "[note_assigner]") {
  SECTION("later note with higher salience replaces") {
    auto kept = deduplicate_notes({note(1.0, 0.2f, Lane::Up), note(1.0004, 0.5f, Lane::Left)});
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].salience == 0.5f);
    REQUIRE(kept[0].lane == Lane::Left);
  }

  SECTION("equal salience keeps the first") {
    auto kept = deduplicate_notes({note(1.0, 0.3f, Lane::Up), note(1.0, 0.3f, Lane::Down)});
    REQUIRE(kept.size() == 1);
    REQUIRE(kept[0].lane == Lane::Up);
  }

  SECTION("distinct milliseconds survive and are sorted") {
    auto kept = deduplicate_notes({note(2.0, 0.1f), note(0.5, 0.1f), note(0.502, 0.1f)});
    REQUIRE(kept.size() == 3);
    REQUIRE(kept[0].time == 0.5);
    REQUIRE(kept[1].time == 0.502);
    REQUIRE(kept[2].time == 2.0);
  }
}

TEST_CASE("enforce_min_separation is greedy from the first note", "[note_assigner]") {
  std::vector<NoteEvent> notes = {note(0.0, 0.1f), note(0.1, 0.9f), note(0.2, 0.1f),
                                  note(0.4, 0.1f), note(0.45, 0.1f)};
  auto spaced = enforce_min_separation(notes, 0.15);

  REQUIRE(spaced.size() == 3);
  REQUIRE(spaced[0].time == 0.0);
  REQUIRE(spaced[1].time == 0.2);
  REQUIRE(spaced[2].time == 0.4);

  REQUIRE(enforce_min_separation({}, 0.15).empty());
  REQUIRE(enforce_min_separation(notes, 0.0).size() == notes.size());
}

TEST_CASE("NoteAssigner output invariants", "[note_assigner]") {
  std::vector<OnsetCandidate> onsets;
  for (int i = 0; i < 40; ++i) {
    double time = 0.07 * static_cast<double>(i);
    float strength = 0.1f + 0.02f * static_cast<float>((i * 7) % 11);
    onsets.push_back(onset(time, strength, 0.01f * static_cast<float>(i % 5)));
  }
  // Duplicate time with higher salience
  onsets.push_back(onset(0.07 * 3.0, 0.9f, 1.0f));

  AssignConfig config;
  config.min_separation = 0.15;
  NoteAssigner assigner(onsets, config);
  const auto& notes = assigner.notes();

  REQUIRE_FALSE(notes.empty());
  REQUIRE(assigner.assigned().size() == onsets.size());
  REQUIRE(assigner.deduplicated().size() == onsets.size() - 1);

  for (size_t i = 1; i < notes.size(); ++i) {
    REQUIRE(notes[i].time > notes[i - 1].time);
    REQUIRE(notes[i].time - notes[i - 1].time >= config.min_separation - kSeparationTolerance);
  }
}

TEST_CASE("NoteAssigner single strong note", "[note_assigner]") {
  NoteAssigner assigner(std::vector<OnsetCandidate>{onset(1.0, 0.4f)});
  REQUIRE(assigner.notes().size() == 1);
  REQUIRE(assigner.notes()[0].lane == Lane::Down);
  REQUIRE(assigner.threshold() == 0.4f);
}

TEST_CASE("NoteAssigner empty input", "[note_assigner]") {
  NoteAssigner assigner(std::vector<OnsetCandidate>{});
  REQUIRE(assigner.notes().empty());
}

TEST_CASE("NoteAssigner rejects invalid config", "[note_assigner]") {
  AssignConfig config;
  config.strong_percentile = 1.0f;
  REQUIRE_THROWS_AS(NoteAssigner({onset(0.0, 0.5f)}, config), NotechartException);

  config = AssignConfig();
  config.min_separation = -0.1;
  REQUIRE_THROWS_AS(NoteAssigner({onset(0.0, 0.5f)}, config), NotechartException);
}

TEST_CASE("enforce_min_separation keeps gaps equal to the minimum", "[note_assigner]") {
  // 3 * 0.3 - 0.6 rounds to just below 0.3 in binary floating point
  std::vector<NoteEvent> notes = {note(0.6, 0.1f), note(0.3 * 3.0, 0.1f)};
  REQUIRE(notes[1].time - notes[0].time < 0.3);

  REQUIRE(enforce_min_separation(notes, 0.3).size() == 2);
  REQUIRE(enforce_min_separation(notes, 0.3 + 1e-6).size() == 1);
}

TEST_CASE("NoteAssigner keeps a grid spaced exactly at the minimum", "[note_assigner]") {
  AssignConfig config;
  config.min_separation = 0.3;

  for (double origin : {0.0, 1.0, 7.3, 33.7}) {
    CAPTURE(origin);
    std::vector<OnsetCandidate> onsets;
    for (int i = 0; i < 60; ++i) {
      onsets.push_back(onset(origin + i * 0.3, 0.2f + 0.1f * static_cast<float>(i % 3)));
    }

    auto quantized = quantize_onsets(onsets, 0.6, {1.0, 0.5});
    NoteAssigner assigner(quantized, config);
    REQUIRE(assigner.deduplicated().size() == 60);
    REQUIRE(assigner.notes().size() == 60);
  }
}

TEST_CASE("NoteAssigner keeps jittered onsets snapped to half beats", "[note_assigner]") {
  std::vector<OnsetCandidate> onsets;
  for (int i = 0; i < 16; ++i) {
    double jitter = i % 2 == 0 ? -0.01 : 0.02;
    onsets.push_back(onset(1.0 + i * 0.3 + jitter, 0.5f));
  }

  auto quantized = quantize_onsets(onsets, 0.6, {1.0, 0.5});
  AssignConfig config;
  config.min_separation = 0.3;
  NoteAssigner assigner(quantized, config);

  const auto& notes = assigner.notes();
  REQUIRE(notes.size() == 16);
  for (size_t i = 1; i < notes.size(); ++i) {
    REQUIRE_THAT(notes[i].time - notes[i - 1].time, WithinAbs(0.3, 1e-9));
  }
}
