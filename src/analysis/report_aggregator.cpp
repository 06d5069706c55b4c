#include "analysis/report_aggregator.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "analysis/coverage.h"
#include "util/exception.h"

namespace emotrace {

namespace {

constexpr double kDistributionTolerance = 0.01;
constexpr size_t kDominantCount = 3;
constexpr float kHighVariabilityRate = 0.3f;

size_t classified_count(const std::vector<TimelineEntry>& timeline) {
  return static_cast<size_t>(std::count_if(timeline.begin(), timeline.end(),
                                           [](const TimelineEntry& e) { return e.classified; }));
}

}  // namespace

EmotionDistribution compute_distribution(const std::vector<TimelineEntry>& timeline,
                                         const std::vector<double>& weights) {
  EmotionDistribution seconds{};
  for (size_t i = 0; i < timeline.size() && i < weights.size(); ++i) {
    if (!timeline[i].classified) continue;
    seconds[emotion_index(timeline[i].emotion())] += weights[i];
  }

  double total = 0.0;
  for (double s : seconds) total += s;

  EmotionDistribution pct{};
  if (total <= 0.0) return pct;
  for (size_t i = 0; i < kEmotionCount; ++i) {
    pct[i] = seconds[i] / total * 100.0;
  }
  return pct;
}

JourneySummary summarize_journey(const std::vector<TimelineEntry>& timeline,
                                 const std::vector<Transition>& transitions,
                                 const EmotionDistribution& distribution) {
  JourneySummary journey;
  journey.total_transitions = transitions.size();

  const size_t entries = classified_count(timeline);
  journey.stability_score = stability_score(entries, transitions.size());
  journey.high_variability =
      static_cast<float>(transitions.size()) > kHighVariabilityRate * static_cast<float>(entries);

  // Stable sort keeps canonical order among equal shares
  std::vector<DominantEmotion> ranked;
  for (Emotion e : kAllEmotions) {
    double pct = distribution[emotion_index(e)];
    if (pct > 0.0) ranked.push_back({e, pct});
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const DominantEmotion& a, const DominantEmotion& b) {
                     return a.percentage > b.percentage;
                   });

  if (!ranked.empty()) {
    journey.primary_emotion = ranked.front().emotion;
  }
  if (ranked.size() > kDominantCount) ranked.resize(kDominantCount);
  journey.dominant_emotions = std::move(ranked);
  return journey;
}

void check_consistency(const std::vector<TimelineEntry>& timeline,
                       const std::vector<Transition>& transitions,
                       const EmotionDistribution& distribution, double covered_seconds,
                       const std::vector<ConfidencePoint>& confidence_curve,
                       const std::vector<HeatmapRow>& heatmap, const JourneySummary& journey) {
  if (covered_seconds > 0.0) {
    double sum = 0.0;
    for (double pct : distribution) sum += pct;
    if (std::abs(sum - 100.0) > kDistributionTolerance) {
      throw ReportConsistencyError("Distribution sums to " + std::to_string(sum) +
                                   "%, expected 100%");
    }
  }
  if (confidence_curve.size() != timeline.size()) {
    throw ReportConsistencyError("Confidence curve has " +
                                 std::to_string(confidence_curve.size()) + " points for " +
                                 std::to_string(timeline.size()) + " timeline entries");
  }
  if (heatmap.size() != timeline.size()) {
    throw ReportConsistencyError("Heatmap has " + std::to_string(heatmap.size()) +
                                 " rows for " + std::to_string(timeline.size()) +
                                 " timeline entries");
  }
  if (journey.total_transitions != transitions.size()) {
    throw ReportConsistencyError("Journey counts " + std::to_string(journey.total_transitions) +
                                 " transitions but " + std::to_string(transitions.size()) +
                                 " were detected");
  }
  for (size_t i = 1; i < timeline.size(); ++i) {
    if (timeline[i].start_seconds() < timeline[i - 1].start_seconds()) {
      throw ReportConsistencyError("Timeline is out of order at entry " + std::to_string(i));
    }
  }
}

AnalysisReport ReportAggregator::aggregate(const ReportMetadata& metadata,
                                           std::vector<TimelineEntry> timeline,
                                           std::vector<Transition> transitions,
                                           std::vector<SentimentEntry> sentiment_timeline,
                                           const SentimentSummary& sentiment) const {
  if (sentiment_timeline.size() != timeline.size()) {
    throw ReportConsistencyError("Sentiment timeline has " +
                                 std::to_string(sentiment_timeline.size()) + " entries for " +
                                 std::to_string(timeline.size()) + " timeline entries");
  }

  const std::vector<double> weights = coverage_weights(timeline);

  AnalysisReport report;
  report.metadata_ = metadata;
  report.distribution_ = compute_distribution(timeline, weights);

  report.confidence_curve_.reserve(timeline.size());
  report.heatmap_.reserve(timeline.size());
  for (const auto& entry : timeline) {
    ConfidencePoint point;
    point.time = entry.start_formatted;
    point.time_seconds = entry.start_seconds();
    point.confidence = entry.confidence();
    point.emotion = entry.emotion();
    report.confidence_curve_.push_back(std::move(point));

    HeatmapRow row;
    row.time = entry.start_formatted;
    row.time_seconds = entry.start_seconds();
    row.intensities = entry.prediction.scores;
    report.heatmap_.push_back(std::move(row));
  }

  report.journey_ = summarize_journey(timeline, transitions, report.distribution_);
  report.sentiment_ = sentiment;

  check_consistency(timeline, transitions, report.distribution_, total_coverage(weights),
                    report.confidence_curve_, report.heatmap_, report.journey_);

  report.timeline_ = std::move(timeline);
  report.transitions_ = std::move(transitions);
  report.sentiment_timeline_ = std::move(sentiment_timeline);
  return report;
}

}  // namespace emotrace
