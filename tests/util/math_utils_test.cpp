/// @file math_utils_test.cpp
/// @brief Tests for math utility functions.

#include "util/math_utils.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <vector>

using namespace emotrace;
using Catch::Matchers::WithinAbs;

TEST_CASE("mean", "[math_utils]") {
  std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  REQUIRE_THAT(mean(data.data(), data.size()), WithinAbs(3.0f, 1e-6f));

  std::vector<float> empty;
  REQUIRE_THAT(mean(empty.data(), empty.size()), WithinAbs(0.0f, 1e-6f));
}

TEST_CASE("stddev", "[math_utils]") {
  std::vector<float> data = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f};
  REQUIRE_THAT(stddev(data.data(), data.size()), WithinAbs(std::sqrt(2.0f), 1e-5f));

  std::vector<float> single = {7.0f};
  REQUIRE(stddev(single.data(), single.size()) == 0.0f);
}

TEST_CASE("argmax", "[math_utils]") {
  std::vector<float> data = {1.0f, 5.0f, 3.0f, 2.0f};
  REQUIRE(argmax(data.data(), data.size()) == 1);

  // First maximum wins
  std::vector<float> ties = {0.2f, 0.4f, 0.4f};
  REQUIRE(argmax(ties.data(), ties.size()) == 1);

  std::vector<float> empty;
  REQUIRE(argmax(empty.data(), empty.size()) == 0);
}

TEST_CASE("clamp", "[math_utils]") {
  REQUIRE(clamp(1.5f, -1.0f, 1.0f) == 1.0f);
  REQUIRE(clamp(-2.0f, -1.0f, 1.0f) == -1.0f);
  REQUIRE(clamp(0.25f, -1.0f, 1.0f) == 0.25f);
}

TEST_CASE("weighted_mean", "[math_utils]") {
  std::vector<float> values = {1.0f, -1.0f, 0.5f};
  std::vector<double> weights = {1.5, 1.0, 1.5};
  REQUIRE_THAT(weighted_mean(values.data(), weights.data(), values.size()),
               WithinAbs((1.5 - 1.0 + 0.75) / 4.0, 1e-9));

  std::vector<double> zero = {0.0, 0.0, 0.0};
  REQUIRE(weighted_mean(values.data(), zero.data(), values.size()) == 0.0);
}

TEST_CASE("softmax", "[math_utils]") {
  SECTION("sums to one and preserves order") {
    std::vector<float> logits = {1.0f, 3.0f, 2.0f};
    softmax(logits.data(), logits.size());
    REQUIRE_THAT(logits[0] + logits[1] + logits[2], WithinAbs(1.0f, 1e-6f));
    REQUIRE(logits[1] > logits[2]);
    REQUIRE(logits[2] > logits[0]);
  }

  SECTION("equal logits give a uniform distribution") {
    std::vector<float> logits(4, 0.0f);
    softmax(logits.data(), logits.size());
    for (float p : logits) REQUIRE_THAT(p, WithinAbs(0.25f, 1e-6f));
  }

  SECTION("large logits stay finite") {
    std::vector<float> logits = {1000.0f, 999.0f};
    softmax(logits.data(), logits.size());
    REQUIRE(std::isfinite(logits[0]));
    REQUIRE_THAT(logits[0] + logits[1], WithinAbs(1.0f, 1e-6f));
  }
}
