/// @file report_aggregator_test.cpp
/// @brief Tests for report assembly and consistency checks.

#include "analysis/report_aggregator.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <utility>
#include <vector>

#include "analysis/coverage.h"
#include "util/exception.h"
#include "util/test_helpers.h"

using namespace emotrace;
using namespace emotrace::test;
using Catch::Matchers::WithinAbs;

namespace {

AnalysisReport build_report(const std::vector<TimelineEntry>& timeline) {
  SentimentMapper sentiment;
  TransitionDetector detector;

  ReportMetadata metadata;
  metadata.duration = timeline.empty() ? 0.0f : timeline.back().end_seconds();
  metadata.total_segments = timeline.size();
  metadata.sample_rate = 100;

  std::vector<Transition> transitions = detector.detect(timeline);
  std::vector<SentimentEntry> sentiment_timeline = sentiment.map_timeline(timeline);
  SentimentSummary summary = sentiment.summarize(timeline);
  return ReportAggregator().aggregate(metadata, timeline, std::move(transitions),
                                      std::move(sentiment_timeline), summary);
}

double distribution_sum(const EmotionDistribution& d) {
  double sum = 0.0;
  for (double p : d) sum += p;
  return sum;
}

}  // namespace

TEST_CASE("ReportAggregator assembles a consistent report", "[report]") {
  std::vector<TimelineEntry> timeline = make_timeline({{Emotion::Happy, 0.8f},
                                                       {Emotion::Happy, 0.8f},
                                                       {Emotion::Sad, 0.6f},
                                                       {Emotion::Sad, 0.6f},
                                                       {Emotion::Sad, 0.6f}});
  AnalysisReport report = build_report(timeline);

  REQUIRE(report.metadata().total_segments == 5);
  REQUIRE(report.timeline().size() == 5);
  REQUIRE(report.sentiment_timeline().size() == 5);
  REQUIRE(report.confidence_curve().size() == 5);
  REQUIRE(report.heatmap().size() == 5);
  REQUIRE(report.transitions().size() == 1);

  // Coverage: happy 1.5 + 1.0, sad 1.0 + 1.0 + 1.5 of 6 s
  REQUIRE_THAT(report.percentage(Emotion::Happy), WithinAbs(2.5 / 6.0 * 100.0, 1e-6));
  REQUIRE_THAT(report.percentage(Emotion::Sad), WithinAbs(3.5 / 6.0 * 100.0, 1e-6));
  REQUIRE_THAT(distribution_sum(report.distribution()), WithinAbs(100.0, 0.01));

  REQUIRE(report.confidence_curve()[2].time == "00:02");
  REQUIRE(report.confidence_curve()[2].emotion == Emotion::Sad);
  REQUIRE_THAT(report.confidence_curve()[2].confidence, WithinAbs(0.6f, 1e-6));
  REQUIRE_THAT(report.heatmap()[0].intensities[emotion_index(Emotion::Happy)],
               WithinAbs(0.8f, 1e-6));

  const JourneySummary& journey = report.journey();
  REQUIRE(journey.primary_emotion == Emotion::Sad);
  REQUIRE(journey.total_transitions == 1);
  REQUIRE_THAT(journey.stability_score, WithinAbs(0.8f, 1e-6));
  REQUIRE_FALSE(journey.high_variability);
  REQUIRE(journey.dominant_emotions.size() == 2);
  REQUIRE(journey.dominant_emotions[0].emotion == Emotion::Sad);
  REQUIRE(journey.dominant_emotions[1].emotion == Emotion::Happy);
}

TEST_CASE("ReportAggregator single label timeline", "[report]") {
  std::vector<TimelineEntry> timeline = make_timeline(
      {{Emotion::Neutral, 0.7f}, {Emotion::Neutral, 0.6f}, {Emotion::Neutral, 0.9f}});
  AnalysisReport report = build_report(timeline);

  REQUIRE_THAT(report.percentage(Emotion::Neutral), WithinAbs(100.0, 1e-9));
  for (Emotion e : kAllEmotions) {
    if (e != Emotion::Neutral) REQUIRE(report.percentage(e) == 0.0);
  }
  REQUIRE(report.transitions().empty());
  REQUIRE(report.journey().stability_score == 1.0f);
  REQUIRE(report.journey().dominant_emotions.size() == 1);
}

TEST_CASE("ReportAggregator flags high variability", "[report]") {
  std::vector<TimelineEntry> timeline = make_timeline({{Emotion::Happy, 0.8f},
                                                       {Emotion::Angry, 0.8f},
                                                       {Emotion::Happy, 0.8f},
                                                       {Emotion::Angry, 0.8f}});
  AnalysisReport report = build_report(timeline);

  REQUIRE(report.journey().total_transitions == 3);
  REQUIRE(report.journey().high_variability);
  REQUIRE_THAT(report.journey().stability_score, WithinAbs(0.25f, 1e-6));
}

TEST_CASE("summarize_journey ranks dominant emotions", "[report]") {
  EmotionDistribution distribution{};
  distribution[emotion_index(Emotion::Fear)] = 10.0;
  distribution[emotion_index(Emotion::Happy)] = 30.0;
  distribution[emotion_index(Emotion::Sad)] = 30.0;
  distribution[emotion_index(Emotion::Surprise)] = 20.0;
  distribution[emotion_index(Emotion::Disgust)] = 10.0;

  JourneySummary journey = summarize_journey({}, {}, distribution);

  // Ties keep canonical order
  REQUIRE(journey.primary_emotion == Emotion::Happy);
  REQUIRE(journey.dominant_emotions.size() == 3);
  REQUIRE(journey.dominant_emotions[0].emotion == Emotion::Happy);
  REQUIRE(journey.dominant_emotions[1].emotion == Emotion::Sad);
  REQUIRE(journey.dominant_emotions[2].emotion == Emotion::Surprise);
  REQUIRE(journey.stability_score == 1.0f);
}

TEST_CASE("compute_distribution ignores gap entries", "[report]") {
  std::vector<TimelineEntry> timeline = make_timeline(
      {{Emotion::Happy, 0.8f}, {Emotion::Angry, 0.8f}, {Emotion::Happy, 0.8f}});
  timeline[1] = make_gap_entry(1, timeline[1].window);

  EmotionDistribution d = compute_distribution(timeline, coverage_weights(timeline));
  REQUIRE_THAT(d[emotion_index(Emotion::Happy)], WithinAbs(100.0, 1e-9));
  REQUIRE(d[emotion_index(Emotion::Angry)] == 0.0);
}

TEST_CASE("check_consistency rejects mismatched parts", "[report]") {
  std::vector<TimelineEntry> timeline =
      make_timeline({{Emotion::Happy, 0.8f}, {Emotion::Sad, 0.6f}});
  std::vector<double> weights = coverage_weights(timeline);
  EmotionDistribution distribution = compute_distribution(timeline, weights);
  std::vector<Transition> transitions = TransitionDetector().detect(timeline);
  JourneySummary journey = summarize_journey(timeline, transitions, distribution);

  std::vector<ConfidencePoint> curve(2);
  std::vector<HeatmapRow> heatmap(2);
  const double covered = total_coverage(weights);

  SECTION("consistent parts pass") {
    REQUIRE_NOTHROW(
        check_consistency(timeline, transitions, distribution, covered, curve, heatmap, journey));
  }

  SECTION("distribution not summing to 100") {
    EmotionDistribution bad = distribution;
    bad[0] += 1.0;
    REQUIRE_THROWS_AS(
        check_consistency(timeline, transitions, bad, covered, curve, heatmap, journey),
        ReportConsistencyError);
  }

  SECTION("confidence curve length") {
    std::vector<ConfidencePoint> short_curve(1);
    REQUIRE_THROWS_AS(check_consistency(timeline, transitions, distribution, covered,
                                        short_curve, heatmap, journey),
                      ReportConsistencyError);
  }

  SECTION("heatmap length") {
    std::vector<HeatmapRow> long_heatmap(3);
    REQUIRE_THROWS_AS(check_consistency(timeline, transitions, distribution, covered, curve,
                                        long_heatmap, journey),
                      ReportConsistencyError);
  }

  SECTION("journey transition count") {
    JourneySummary bad = journey;
    bad.total_transitions = 5;
    REQUIRE_THROWS_AS(
        check_consistency(timeline, transitions, distribution, covered, curve, heatmap, bad),
        ReportConsistencyError);
  }

  SECTION("timeline order") {
    std::vector<TimelineEntry> reversed = {timeline[1], timeline[0]};
    REQUIRE_THROWS_AS(check_consistency(reversed, transitions, distribution, covered, curve,
                                        heatmap, journey),
                      ReportConsistencyError);
  }
}

TEST_CASE("ReportAggregator rejects a mismatched sentiment timeline", "[report]") {
  std::vector<TimelineEntry> timeline =
      make_timeline({{Emotion::Happy, 0.8f}, {Emotion::Sad, 0.6f}});
  SentimentMapper sentiment;
  std::vector<SentimentEntry> partial = sentiment.map_timeline(timeline);
  partial.pop_back();

  try {
    ReportAggregator().aggregate(ReportMetadata(), timeline, TransitionDetector().detect(timeline),
                                 partial, sentiment.summarize(timeline));
    FAIL("expected ReportConsistencyError");
  } catch (const ReportConsistencyError& e) {
    REQUIRE(e.code() == ErrorCode::ReportInconsistent);
  }
}
