/// @file difficulty_test.cpp
/// @brief Tests for difficulty profiles.

#include "analysis/difficulty.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <vector>

#include "util/exception.h"

using namespace notechart;
using Catch::Matchers::WithinAbs;

TEST_CASE("difficulty_profile table", "[difficulty]") {
  SECTION("easy") {
    DifficultyProfile p = difficulty_profile(Difficulty::Easy);
    REQUIRE(p.difficulty == Difficulty::Easy);
    REQUIRE_THAT(p.min_separation, WithinAbs(0.3, 1e-9));
    REQUIRE_THAT(p.sensitivity, WithinAbs(0.5f, 1e-6f));
    REQUIRE(p.subdivisions == std::vector<double>{1.0, 0.5});
  }

  SECTION("medium") {
    DifficultyProfile p = difficulty_profile(Difficulty::Medium);
    REQUIRE_THAT(p.min_separation, WithinAbs(0.15, 1e-9));
    REQUIRE_THAT(p.sensitivity, WithinAbs(0.8f, 1e-6f));
    REQUIRE(p.subdivisions == std::vector<double>{1.0, 0.5, 0.25});
  }

  SECTION("hard") {
    DifficultyProfile p = difficulty_profile(Difficulty::Hard);
    REQUIRE_THAT(p.min_separation, WithinAbs(0.08, 1e-9));
    REQUIRE_THAT(p.sensitivity, WithinAbs(1.2f, 1e-6f));
    REQUIRE(p.subdivisions == std::vector<double>{1.0, 0.5, 0.25, 0.125});
  }
}

TEST_CASE("harder profiles allow denser charts", "[difficulty]") {
  DifficultyProfile easy = difficulty_profile(Difficulty::Easy);
  DifficultyProfile medium = difficulty_profile(Difficulty::Medium);
  DifficultyProfile hard = difficulty_profile(Difficulty::Hard);

  REQUIRE(easy.min_separation > medium.min_separation);
  REQUIRE(medium.min_separation > hard.min_separation);
  REQUIRE(easy.subdivisions.size() < hard.subdivisions.size());
}

TEST_CASE("parse_difficulty", "[difficulty]") {
  REQUIRE(parse_difficulty("easy") == Difficulty::Easy);
  REQUIRE(parse_difficulty("Medium") == Difficulty::Medium);
  REQUIRE(parse_difficulty("HARD") == Difficulty::Hard);

  try {
    parse_difficulty("expert");
    FAIL("Expected NotechartException");
  } catch (const NotechartException& e) {
    REQUIRE(e.code() == ErrorCode::InvalidParameter);
  }
}

TEST_CASE("difficulty and lane names", "[difficulty]") {
  REQUIRE(std::string(difficulty_name(Difficulty::Easy)) == "easy");
  REQUIRE(std::string(difficulty_name(Difficulty::Hard)) == "hard");
  REQUIRE(std::string(lane_name(Lane::Up)) == "ArrowUp");
  REQUIRE(std::string(lane_name(Lane::Right)) == "ArrowRight");
  REQUIRE(is_strong_lane(Lane::Down));
  REQUIRE_FALSE(is_strong_lane(Lane::Left));
}
