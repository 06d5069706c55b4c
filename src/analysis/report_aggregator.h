#pragma once

/// @file report_aggregator.h
/// @brief Assembles the immutable analysis report.

#include <array>
#include <string>
#include <vector>

#include "analysis/sentiment_mapper.h"
#include "analysis/timeline_builder.h"
#include "analysis/transition_detector.h"
#include "util/types.h"

namespace emotrace {

/// @brief Percentage of covered duration per emotion, indexed by Emotion.
using EmotionDistribution = std::array<double, kEmotionCount>;

/// @brief Facts about the analyzed audio.
struct ReportMetadata {
  float duration = 0.0f;      ///< Normalized audio duration in seconds
  size_t total_segments = 0;  ///< Number of windows
  int sample_rate = 0;        ///< Normalized sample rate in Hz
};

/// @brief One point of the confidence curve.
struct ConfidencePoint {
  std::string time;  ///< "MM:SS"
  float time_seconds = 0.0f;
  float confidence = 0.0f;
  Emotion emotion = Emotion::Neutral;
};

/// @brief One row of the heatmap grid.
struct HeatmapRow {
  std::string time;  ///< "MM:SS"
  float time_seconds = 0.0f;
  EmotionScores intensities{};  ///< Full distribution in canonical order
};

/// @brief An emotion and its share of covered duration.
struct DominantEmotion {
  Emotion emotion = Emotion::Neutral;
  double percentage = 0.0;
};

/// @brief Narrative summary of the timeline.
struct JourneySummary {
  Emotion primary_emotion = Emotion::Neutral;    ///< Label with the greatest coverage
  size_t total_transitions = 0;                  ///< Number of detected transitions
  float stability_score = 1.0f;                  ///< max(0, 1 - transitions / entries)
  std::vector<DominantEmotion> dominant_emotions;  ///< Top 3 labels by coverage
  bool high_variability = false;                 ///< transitions > 0.3 * entries
};

/// @brief Terminal, immutable analysis artifact.
/// @details Only ReportAggregator creates reports, and only after the consistency check
/// has passed. Every part is exposed read-only.
class AnalysisReport {
 public:
  const ReportMetadata& metadata() const { return metadata_; }
  const std::vector<TimelineEntry>& timeline() const { return timeline_; }
  const std::vector<SentimentEntry>& sentiment_timeline() const { return sentiment_timeline_; }
  const std::vector<Transition>& transitions() const { return transitions_; }
  const EmotionDistribution& distribution() const { return distribution_; }
  const std::vector<ConfidencePoint>& confidence_curve() const { return confidence_curve_; }
  const std::vector<HeatmapRow>& heatmap() const { return heatmap_; }
  const SentimentSummary& sentiment() const { return sentiment_; }
  const JourneySummary& journey() const { return journey_; }

  /// @brief Returns the percentage of covered duration for one emotion.
  double percentage(Emotion emotion) const { return distribution_[emotion_index(emotion)]; }

 private:
  friend class ReportAggregator;
  AnalysisReport() = default;

  ReportMetadata metadata_;
  std::vector<TimelineEntry> timeline_;
  std::vector<SentimentEntry> sentiment_timeline_;
  std::vector<Transition> transitions_;
  EmotionDistribution distribution_{};
  std::vector<ConfidencePoint> confidence_curve_;
  std::vector<HeatmapRow> heatmap_;
  SentimentSummary sentiment_;
  JourneySummary journey_;
};

/// @brief Computes the emotion distribution from coverage weights.
/// @return Percentages summing to 100 (all zero if nothing is covered)
EmotionDistribution compute_distribution(const std::vector<TimelineEntry>& timeline,
                                         const std::vector<double>& weights);

/// @brief Builds the journey summary.
JourneySummary summarize_journey(const std::vector<TimelineEntry>& timeline,
                                 const std::vector<Transition>& transitions,
                                 const EmotionDistribution& distribution);

/// @brief Verifies the invariants tying report parts together.
/// @throws ReportConsistencyError naming the first violated invariant
void check_consistency(const std::vector<TimelineEntry>& timeline,
                       const std::vector<Transition>& transitions,
                       const EmotionDistribution& distribution, double covered_seconds,
                       const std::vector<ConfidencePoint>& confidence_curve,
                       const std::vector<HeatmapRow>& heatmap, const JourneySummary& journey);

/// @brief Composes timeline, transitions and sentiment into an AnalysisReport.
class ReportAggregator {
 public:
  /// @brief Assembles and checks a report.
  /// @param metadata Audio facts
  /// @param timeline Entries ordered by start time
  /// @param transitions Output of TransitionDetector for the same timeline
  /// @param sentiment_timeline Output of SentimentMapper::map_timeline
  /// @param sentiment Output of SentimentMapper::summarize
  /// @throws ReportConsistencyError if the parts disagree
  AnalysisReport aggregate(const ReportMetadata& metadata, std::vector<TimelineEntry> timeline,
                           std::vector<Transition> transitions,
                           std::vector<SentimentEntry> sentiment_timeline,
                           const SentimentSummary& sentiment) const;
};

}  // namespace emotrace
