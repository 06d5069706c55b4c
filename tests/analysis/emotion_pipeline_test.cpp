/// @file emotion_pipeline_test.cpp
/// @brief End-to-end tests for the emotion analysis pipeline.

#include "analysis/emotion_pipeline.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <cmath>
#include <string>
#include <vector>

#include "analysis/report_json.h"
#include "core/audio_io.h"
#include "util/exception.h"
#include "util/test_helpers.h"

using namespace emotrace;
using namespace emotrace::test;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

constexpr int kRate = 16000;

/// @brief Level 0 -> happy at 0.8, level 1 -> sad at 0.6, anything else fails.
ClassifyFn happy_sad_classifier() {
  return [](const float* samples, size_t, int) {
    int level = static_cast<int>(std::lround(samples[0] * 10.0f));
    if (level == 0) return peaked_scores(Emotion::Happy, 0.8f);
    if (level == 1) return peaked_scores(Emotion::Sad, 0.6f);
    throw std::runtime_error("unexpected level");
  };
}

double distribution_sum(const AnalysisReport& report) {
  double sum = 0.0;
  for (double p : report.distribution()) sum += p;
  return sum;
}

}  // namespace

TEST_CASE("EmotionPipeline happy to sad recording", "[pipeline]") {
  // 6 s: happy for the first two seconds, sad afterwards
  AudioBuffer audio = level_audio({0, 0, 1, 1, 1, 1}, kRate);
  EmotionPipeline pipeline(PipelineConfig(), happy_sad_classifier());

  AnalysisReport report = pipeline.analyze(audio);

  REQUIRE(report.metadata().total_segments == 5);
  REQUIRE(report.metadata().sample_rate == kRate);
  REQUIRE_THAT(report.metadata().duration, WithinAbs(6.0f, 1e-6));

  const auto& timeline = report.timeline();
  REQUIRE(timeline.size() == 5);
  const Emotion expected[] = {Emotion::Happy, Emotion::Happy, Emotion::Sad, Emotion::Sad,
                              Emotion::Sad};
  for (size_t i = 0; i < timeline.size(); ++i) {
    REQUIRE(timeline[i].emotion() == expected[i]);
  }

  REQUIRE(report.transitions().size() == 1);
  const Transition& t = report.transitions()[0];
  REQUIRE(t.time_formatted == "00:02");
  REQUIRE(t.from_emotion == Emotion::Happy);
  REQUIRE(t.to_emotion == Emotion::Sad);
  REQUIRE_THAT(t.confidence_change, WithinAbs(-0.2f, 1e-6));
  REQUIRE(t.is_significant);

  REQUIRE_THAT(report.percentage(Emotion::Happy), WithinAbs(2.5 / 6.0 * 100.0, 1e-4));
  REQUIRE_THAT(report.percentage(Emotion::Sad), WithinAbs(3.5 / 6.0 * 100.0, 1e-4));
  REQUIRE_THAT(distribution_sum(report), WithinAbs(100.0, 0.01));

  // (0.8 * 2.5 - 0.7 * 0.6 * 3.5) / 6
  REQUIRE_THAT(report.sentiment().score, WithinAbs((2.0f - 1.47f) / 6.0f, 1e-4));
  REQUIRE(report.journey().primary_emotion == Emotion::Sad);
  REQUIRE(report.confidence_curve().size() == 5);
  REQUIRE(report.heatmap().size() == 5);
}

TEST_CASE("EmotionPipeline serializes identical reports identically", "[pipeline]") {
  AudioBuffer audio = level_audio({0, 1, 0, 1, 1, 0, 0}, kRate);

  PipelineConfig serial;
  PipelineConfig parallel;
  parallel.timeline.n_threads = 4;

  std::string a = to_json(EmotionPipeline(serial, happy_sad_classifier()).analyze(audio));
  std::string b = to_json(EmotionPipeline(serial, happy_sad_classifier()).analyze(audio));
  std::string c = to_json(EmotionPipeline(parallel, happy_sad_classifier()).analyze(audio));
  REQUIRE(a == b);
  REQUIRE(a == c);

  REQUIRE_THAT(a, ContainsSubstring("\"metadata\""));
  REQUIRE_THAT(a, ContainsSubstring("\"heatmap_data\""));
  REQUIRE_THAT(a, ContainsSubstring("\"journey_analysis\""));
  REQUIRE_THAT(a, ContainsSubstring("\"start_formatted\": \"00:00\""));
}

TEST_CASE("EmotionPipeline rejects empty audio", "[pipeline]") {
  EmotionPipeline pipeline(PipelineConfig(), fixed_classifier(Emotion::Neutral));
  REQUIRE_THROWS_AS(pipeline.analyze(AudioBuffer()), EmptyAudioError);
  REQUIRE_THROWS_AS(pipeline.quick_analyze(AudioBuffer()), EmptyAudioError);

  std::vector<uint8_t> none;
  REQUIRE_THROWS_AS(pipeline.analyze_memory(none.data(), 0), EmptyAudioError);
}

TEST_CASE("EmotionPipeline rejects audio shorter than one window", "[pipeline]") {
  EmotionPipeline pipeline(PipelineConfig(), fixed_classifier(Emotion::Neutral));
  AudioBuffer audio = level_audio({0}, kRate);
  REQUIRE_THROWS_AS(pipeline.analyze(audio), InvalidWindowConfigError);
}

TEST_CASE("EmotionPipeline failure policies", "[pipeline]") {
  // Level 5 makes every window starting in second 3 fail
  AudioBuffer audio = level_audio({0, 0, 0, 5, 1, 1}, kRate);

  SECTION("abort") {
    EmotionPipeline pipeline(PipelineConfig(), happy_sad_classifier());
    try {
      pipeline.analyze(audio);
      FAIL("expected ClassificationError");
    } catch (const ClassificationError& e) {
      REQUIRE_THAT(e.start_seconds(), WithinAbs(3.0f, 1e-6));
      REQUIRE_THAT(e.end_seconds(), WithinAbs(5.0f, 1e-6));
    }
  }

  SECTION("placeholder") {
    PipelineConfig config;
    config.timeline.failure_policy = FailurePolicy::Placeholder;
    AnalysisReport report = EmotionPipeline(config, happy_sad_classifier()).analyze(audio);

    REQUIRE(report.timeline().size() == 5);
    REQUIRE_FALSE(report.timeline()[3].classified);
    REQUIRE(report.transitions().size() == 1);
    REQUIRE(report.transitions()[0].from_index == 2);
    REQUIRE(report.transitions()[0].to_index == 4);
    REQUIRE_THAT(distribution_sum(report), WithinAbs(100.0, 0.01));
  }
}

TEST_CASE("EmotionPipeline reports progress in stage order", "[pipeline]") {
  AudioBuffer audio = level_audio({0, 0, 1, 1}, kRate);
  EmotionPipeline pipeline(PipelineConfig(), happy_sad_classifier());

  std::vector<std::string> stages;
  std::vector<float> progress;
  pipeline.set_progress_callback([&](float p, const char* stage) {
    progress.push_back(p);
    if (stages.empty() || stages.back() != stage) stages.push_back(stage);
  });
  pipeline.analyze(audio);

  const std::vector<std::string> expected = {"validating", "segmenting", "classifying",
                                             "transitions", "sentiment", "aggregating",
                                             "complete"};
  REQUIRE(stages == expected);
  for (size_t i = 1; i < progress.size(); ++i) {
    REQUIRE(progress[i] >= progress[i - 1]);
  }
  REQUIRE(progress.back() == 1.0f);
}

TEST_CASE("EmotionPipeline honours cancellation", "[pipeline]") {
  AudioBuffer audio = level_audio({0, 0, 1, 1, 1, 1}, kRate);
  EmotionPipeline pipeline(PipelineConfig(), happy_sad_classifier());

  SECTION("before start") {
    CancellationToken token;
    token.cancel();
    REQUIRE_THROWS_AS(pipeline.analyze(audio, token), AnalysisCancelled);
  }

  SECTION("from the progress callback") {
    CancellationToken token;
    pipeline.set_progress_callback([&](float, const char* stage) {
      if (std::string(stage) == "classifying") token.cancel();
    });
    REQUIRE_THROWS_AS(pipeline.analyze(audio, token), AnalysisCancelled);
  }
}

TEST_CASE("EmotionPipeline analyzes encoded bytes", "[pipeline]") {
  AudioBuffer audio = level_audio({0, 0, 1, 1, 1, 1}, kRate);
  std::vector<float> samples(audio.begin(), audio.end());
  std::vector<uint8_t> wav = encode_wav(samples.data(), samples.size(), kRate);

  EmotionPipeline pipeline(PipelineConfig(), happy_sad_classifier());
  AnalysisReport report = pipeline.analyze_memory(wav.data(), wav.size());
  REQUIRE(report.timeline().size() == 5);
  REQUIRE(report.transitions().size() == 1);

  std::vector<uint8_t> garbage(128, 0x11);
  REQUIRE_THROWS_AS(pipeline.analyze_memory(garbage.data(), garbage.size()),
                    UnsupportedFormatError);
}

TEST_CASE("EmotionPipeline quick_analyze classifies the whole buffer", "[pipeline]") {
  EmotionPipeline pipeline(PipelineConfig(), fixed_classifier(Emotion::Surprise, 0.55f));
  QuickResult result = pipeline.quick_analyze(level_audio({0, 0, 0}, kRate));
  REQUIRE(result.emotion == Emotion::Surprise);
  REQUIRE_THAT(result.confidence, WithinAbs(0.55f, 1e-6));
}

TEST_CASE("EmotionPipeline with the default classifier", "[pipeline]") {
  std::vector<float> samples = sine(180.0f, 6.0f, kRate, 0.3f);
  AudioBuffer audio = AudioBuffer::from_vector(samples, kRate);

  EmotionPipeline pipeline;
  AnalysisReport report = pipeline.analyze(audio);

  REQUIRE(report.timeline().size() == 5);
  REQUIRE_THAT(distribution_sum(report), WithinAbs(100.0, 0.01));
  REQUIRE(report.sentiment().score >= -1.0f);
  REQUIRE(report.sentiment().score <= 1.0f);
  REQUIRE(report.journey().total_transitions == report.transitions().size());
}

TEST_CASE("EmotionPipeline segment exposes the windows", "[pipeline]") {
  PipelineConfig config;
  config.segmenter.window_sec = 1.0f;
  config.segmenter.overlap_sec = 0.5f;
  EmotionPipeline pipeline(config, fixed_classifier(Emotion::Neutral));

  std::vector<Window> windows = pipeline.segment(level_audio({0, 0, 0}, kRate));
  REQUIRE(windows.size() == 5);
  REQUIRE_THAT(windows[1].start_seconds, WithinAbs(0.5f, 1e-6));
}

TEST_CASE("EmotionPipeline rejects invalid stage configuration", "[pipeline]") {
  PipelineConfig config;
  config.sentiment.table[0] = 2.0f;
  REQUIRE_THROWS_AS(EmotionPipeline(config, fixed_classifier(Emotion::Neutral)),
                    EmotraceException);
  REQUIRE_THROWS_AS(EmotionPipeline(PipelineConfig(), ClassifyFn()), EmotraceException);
}
