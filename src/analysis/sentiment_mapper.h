#pragma once

/// @file sentiment_mapper.h
/// @brief Maps emotions to signed sentiment and aggregates it over a timeline.

#include <array>
#include <vector>

#include "analysis/timeline_builder.h"
#include "util/types.h"

namespace emotrace {

/// @brief Sentiment policy.
/// @details The default table, indexed by Emotion, is happy=+1.0, sad=-0.7, angry=-1.0,
/// neutral=0.0, fear=-0.5, disgust=-0.8, surprise=+0.3.
struct SentimentConfig {
  std::array<float, kEmotionCount> table = {1.0f, -0.7f, -1.0f, 0.0f, -0.5f, -0.8f, 0.3f};
  float positive_threshold = 0.15f;   ///< score > threshold is positive
  float negative_threshold = -0.15f;  ///< score < threshold is negative
};

/// @brief Sentiment of one timeline entry.
struct SentimentEntry {
  float time_seconds = 0.0f;            ///< Entry start
  Emotion emotion = Emotion::Neutral;   ///< Entry label
  float value = 0.0f;                   ///< table[emotion] (unweighted)
  float score = 0.0f;                   ///< table[emotion] * confidence
  Polarity category = Polarity::Neutral;
};

/// @brief Share of covered duration per sentiment category, in percent.
struct SentimentBreakdown {
  double positive = 0.0;
  double neutral = 0.0;
  double negative = 0.0;
};

/// @brief Overall sentiment of a timeline.
struct SentimentSummary {
  float score = 0.0f;  ///< Coverage-weighted mean in [-1, 1]
  Polarity category = Polarity::Neutral;
  SentimentBreakdown breakdown;
};

/// @brief Sentiment lookup and aggregation.
class SentimentMapper {
 public:
  /// @brief Constructs a mapper.
  /// @throws EmotraceException(InvalidParameter) if a table value is outside [-1, 1]
  /// or positive_threshold < negative_threshold
  explicit SentimentMapper(const SentimentConfig& config = SentimentConfig());

  /// @brief Returns the table value of an emotion.
  float emotion_value(Emotion emotion) const { return config_.table[emotion_index(emotion)]; }

  /// @brief Returns the category of an emotion's table value.
  Polarity emotion_polarity(Emotion emotion) const { return categorize(emotion_value(emotion)); }

  /// @brief Applies the category thresholds to a score.
  Polarity categorize(float score) const;

  /// @brief Returns table[emotion] * confidence (0 for gap entries).
  float map_entry(const TimelineEntry& entry) const;

  /// @brief Maps every entry, preserving order.
  std::vector<SentimentEntry> map_timeline(const std::vector<TimelineEntry>& timeline) const;

  /// @brief Aggregates per-entry sentiment with coverage weights.
  /// @param entries Per-entry sentiment
  /// @param weights Coverage weight of each entry in seconds
  /// @throws EmotraceException(InvalidParameter) if the lengths differ
  SentimentSummary summarize(const std::vector<SentimentEntry>& entries,
                             const std::vector<double>& weights) const;

  /// @brief Maps and aggregates a timeline using its coverage weights.
  SentimentSummary summarize(const std::vector<TimelineEntry>& timeline) const;

  const SentimentConfig& config() const { return config_; }

 private:
  SentimentConfig config_;
};

}  // namespace emotrace
