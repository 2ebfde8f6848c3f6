/// @file math_utils_test.cpp
/// @brief Tests for math utility functions.

#include "util/math_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

using namespace notechart;
using Catch::Matchers::WithinAbs;

TEST_CASE("mean", "[math_utils]") {
  std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  REQUIRE_THAT(mean(data.data(), data.size()), WithinAbs(3.0f, 1e-6f));

  std::vector<float> empty;
  REQUIRE_THAT(mean(empty.data(), empty.size()), WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("variance is population variance", "[math_utils]") {
  std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  REQUIRE_THAT(variance(data.data(), data.size()), WithinAbs(2.0f, 1e-6f));

  std::vector<float> single = {7.0f};
  REQUIRE_THAT(variance(single.data(), single.size()), WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("stddev", "[math_utils]") {
  std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  REQUIRE_THAT(stddev(data.data(), data.size()), WithinAbs(std::sqrt(2.0f), 1e-5f));
}

TEST_CASE("argmax", "[math_utils]") {
  std::vector<float> data = {1.0f, 5.0f, 3.0f, 2.0f};
  REQUIRE(argmax(data.data(), data.size()) == 1);

  std::vector<int> ties = {2, 4, 4, 1};
  REQUIRE(argmax(ties.data(), ties.size()) == 1);

  std::vector<float> empty;
  REQUIRE(argmax(empty.data(), empty.size()) == 0);
}

TEST_CASE("round_half_up", "[math_utils]") {
  REQUIRE(round_half_up(2.5f) == 3.0f);
  REQUIRE(round_half_up(-2.5f) == -2.0f);
  REQUIRE(round_half_up(1.4f) == 1.0f);
  REQUIRE(round_half_up(-0.8f) == -1.0f);
}

TEST_CASE("rank_percentile", "[math_utils]") {
  std::vector<float> data = {5.0f, 1.0f, 4.0f, 2.0f, 3.0f};

  SECTION("nearest rank without interpolation") {
    REQUIRE(rank_percentile(data.data(), data.size(), 0.6f) == 4.0f);
    REQUIRE(rank_percentile(data.data(), data.size(), 0.0f) == 1.0f);
  }

  SECTION("clamps to the last element") {
    REQUIRE(rank_percentile(data.data(), data.size(), 1.0f) == 5.0f);
  }

  SECTION("empty input") {
    std::vector<float> empty;
    REQUIRE(rank_percentile(empty.data(), empty.size(), 0.5f) == 0.0f);
  }
}

TEST_CASE("positive_values", "[math_utils]") {
  std::vector<float> data = {0.0f, -1.0f, 2.0f, 0.0f, 3.0f};
  std::vector<float> positive = positive_values(data.data(), data.size());

  REQUIRE(positive.size() == 2);
  REQUIRE(positive[0] == 2.0f);
  REQUIRE(positive[1] == 3.0f);
}
