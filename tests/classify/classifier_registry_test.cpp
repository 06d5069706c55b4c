/// @file classifier_registry_test.cpp
/// @brief Tests for the process-wide default classifier.

#include "classify/classifier_registry.h"

#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>

#include "util/test_helpers.h"

using namespace emotrace;
using namespace emotrace::test;

TEST_CASE("default_classifier is created lazily", "[registry]") {
  reset_default_classifier();
  REQUIRE_FALSE(default_classifier_initialized());

  ClassifyFn classify = default_classifier();
  REQUIRE(static_cast<bool>(classify));
  REQUIRE(default_classifier_initialized());

  std::vector<float> silence(16000, 0.0f);
  EmotionScores scores = classify(silence.data(), silence.size(), 16000);
  REQUIRE(scores[emotion_index(Emotion::Neutral)] > scores[emotion_index(Emotion::Happy)]);

  reset_default_classifier();
}

TEST_CASE("set_default_classifier installs an override", "[registry]") {
  set_default_classifier(fixed_classifier(Emotion::Disgust, 0.9f));
  REQUIRE(default_classifier_initialized());

  std::vector<float> samples(10, 0.0f);
  EmotionScores scores = default_classifier()(samples.data(), samples.size(), 16000);
  REQUIRE(scores[emotion_index(Emotion::Disgust)] == 0.9f);

  // An empty function restores lazy creation
  set_default_classifier(ClassifyFn());
  REQUIRE_FALSE(default_classifier_initialized());
}

TEST_CASE("default_classifier is safe to initialize concurrently", "[registry]") {
  reset_default_classifier();

  std::vector<std::thread> threads;
  std::vector<int> ok(8, 0);
  for (size_t t = 0; t < ok.size(); ++t) {
    threads.emplace_back([&ok, t]() { ok[t] = default_classifier() ? 1 : 0; });
  }
  for (auto& th : threads) th.join();

  for (int v : ok) REQUIRE(v == 1);
  reset_default_classifier();
}
