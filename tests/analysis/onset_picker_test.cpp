/// @file onset_picker_test.cpp
/// @brief Tests for onset picking.

#include "analysis/onset_picker.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace notechart;
using Catch::Matchers::WithinAbs;

namespace {

// sr / hop chosen so that frame k sits at k * 0.1 s
constexpr int kSr = 1000;
constexpr int kHop = 100;

/// @brief Envelope with a distinct value per frame, to check strength lookup.
std::vector<float> indexed_envelope(size_t n) {
  std::vector<float> envelope(n);
  for (size_t i = 0; i < n; ++i) envelope[i] = 0.01f * static_cast<float>(i);
  return envelope;
}

}  // namespace

TEST_CASE("OnsetPicker finds peaks above threshold", "[onset_picker]") {
  std::vector<float> curve = {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f, 0.0f};
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop);

  // positive values {1, 2}: mean 1.5, stddev 0.5
  REQUIRE_THAT(picker.mean(), WithinAbs(1.5f, 1e-6f));
  REQUIRE_THAT(picker.stddev(), WithinAbs(0.5f, 1e-6f));
  REQUIRE_THAT(picker.threshold(), WithinAbs(1.9f, 1e-6f));

  REQUIRE(picker.count() == 1);
  const OnsetCandidate& c = picker.candidates()[0];
  REQUIRE(c.frame == 6);
  REQUIRE_THAT(c.time, WithinAbs(0.6, 1e-9));
  REQUIRE_THAT(c.strength, WithinAbs(0.06f, 1e-6f));
  REQUIRE_THAT(c.salience, WithinAbs(2.0f, 1e-6f));
  REQUIRE_FALSE(picker.rescued());
}

TEST_CASE("OnsetPicker sensitivity controls threshold", "[onset_picker]") {
  std::vector<float> curve = {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f, 0.0f};
  std::vector<float> envelope = indexed_envelope(curve.size());

  OnsetPickConfig loose;
  loose.sensitivity = -2.0f;
  OnsetPicker picker(curve, envelope, kSr, kHop, loose);

  REQUIRE(picker.count() == 2);
  REQUIRE(picker.candidates()[0].frame == 2);
  REQUIRE(picker.candidates()[1].frame == 6);
}

TEST_CASE("OnsetPicker requires strict local maximum", "[onset_picker]") {
  // Plateau at 3: neither frame is strictly greater than both neighbours
  std::vector<float> curve = {0.0f, 1.0f, 3.0f, 3.0f, 1.0f, 0.0f, 0.5f, 0.0f};
  OnsetPickConfig config;
  config.sensitivity = -10.0f;
  config.rescue_sensitivity = 100.0f;
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop, config);

  REQUIRE(picker.count() == 1);
  REQUIRE(picker.candidates()[0].frame == 6);
}

TEST_CASE("OnsetPicker rescues a leading onset", "[onset_picker]") {
  // positive values {3, 3, 4, 1}: mean 2.75, stddev ~1.09
  // strict threshold ~3.62 picks frame 8; loose threshold ~2.86 first hits frame 1
  std::vector<float> curve = {0.0f, 3.0f, 3.0f, 0.0f, 0.0f, 0.0f,
                              0.0f, 0.0f, 4.0f, 0.0f, 1.0f, 0.0f};
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop);

  REQUIRE(picker.rescued());
  REQUIRE(picker.count() == 2);
  REQUIRE(picker.candidates()[0].frame == 1);
  REQUIRE_THAT(picker.candidates()[0].time, WithinAbs(0.1, 1e-9));
  REQUIRE_THAT(picker.candidates()[0].strength, WithinAbs(0.01f, 1e-6f));
  REQUIRE(picker.candidates()[1].frame == 8);
}

TEST_CASE("OnsetPicker rescue when no peak is found", "[onset_picker]") {
  std::vector<float> curve = {0.0f, 2.0f, 2.0f, 0.0f, 1.0f, 0.0f};
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop);

  REQUIRE(picker.rescued());
  REQUIRE(picker.count() == 1);
  REQUIRE(picker.candidates()[0].frame == 1);
}

TEST_CASE("OnsetPicker skips rescue close to first peak", "[onset_picker]") {
  // loose threshold is first crossed at the detected peak itself
  std::vector<float> curve = {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f, 0.0f};
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop);
  REQUIRE_FALSE(picker.rescued());
}

TEST_CASE("OnsetPicker silence yields no onsets", "[onset_picker]") {
  std::vector<float> curve(50, 0.0f);
  OnsetPicker picker(curve, curve, kSr, kHop);

  REQUIRE(picker.count() == 0);
  REQUIRE(picker.threshold() == 0.0f);
  REQUIRE_FALSE(picker.rescued());
}

TEST_CASE("OnsetPicker flat curve yields no onsets", "[onset_picker]") {
  std::vector<float> curve = {0.0f, 1.0f, 1.0f, 1.0f, 0.0f};
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop);
  REQUIRE(picker.count() == 0);
}

TEST_CASE("OnsetPicker output is time ascending", "[onset_picker]") {
  std::vector<float> curve(200, 0.0f);
  for (size_t i = 5; i < curve.size(); i += 13) {
    curve[i] = 1.0f + 0.1f * static_cast<float>(i % 5);
  }
  OnsetPicker picker(curve, indexed_envelope(curve.size()), kSr, kHop);

  const auto& candidates = picker.candidates();
  REQUIRE(candidates.size() > 1);
  for (size_t i = 1; i < candidates.size(); ++i) {
    REQUIRE(candidates[i].time > candidates[i - 1].time);
  }
  REQUIRE(picker.onset_times().size() == candidates.size());
}

TEST_CASE("OnsetPicker rejects invalid input", "[onset_picker]") {
  std::vector<float> curve(10, 0.0f);
  std::vector<float> envelope(9, 0.0f);

  REQUIRE_THROWS_AS(OnsetPicker(curve, envelope, kSr, kHop), NotechartException);
  REQUIRE_THROWS_AS(OnsetPicker(curve, curve, 0, kHop), NotechartException);
  REQUIRE_THROWS_AS(OnsetPicker(curve, curve, kSr, 0), NotechartException);
}

TEST_CASE("pick_onsets", "[onset_picker]") {
  std::vector<float> curve = {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 2.0f, 0.0f, 0.0f};
  auto candidates = pick_onsets(curve, indexed_envelope(curve.size()), kSr, kHop);
  REQUIRE(candidates.size() == 1);
  REQUIRE(candidates[0].frame == 6);
}
