#include "analysis/sentiment_mapper.h"

#include <cmath>
#include <string>

#include "analysis/coverage.h"
#include "util/exception.h"
#include "util/math_utils.h"

namespace emotrace {

SentimentMapper::SentimentMapper(const SentimentConfig& config) : config_(config) {
  for (Emotion e : kAllEmotions) {
    float v = config_.table[emotion_index(e)];
    EMOTRACE_CHECK_MSG(std::isfinite(v) && v >= -1.0f && v <= 1.0f, ErrorCode::InvalidParameter,
                       std::string("Sentiment value for '") + emotion_name(e) +
                           "' must be in [-1, 1]: " + std::to_string(v));
  }
  EMOTRACE_CHECK_MSG(config_.positive_threshold >= config_.negative_threshold,
                     ErrorCode::InvalidParameter,
                     "positive_threshold must be >= negative_threshold (" +
                         std::to_string(config_.positive_threshold) + " < " +
                         std::to_string(config_.negative_threshold) + ")");
}

Polarity SentimentMapper::categorize(float score) const {
  if (score > config_.positive_threshold) return Polarity::Positive;
  if (score < config_.negative_threshold) return Polarity::Negative;
  return Polarity::Neutral;
}

float SentimentMapper::map_entry(const TimelineEntry& entry) const {
  if (!entry.classified) return 0.0f;
  return emotion_value(entry.emotion()) * entry.confidence();
}

std::vector<SentimentEntry> SentimentMapper::map_timeline(
    const std::vector<TimelineEntry>& timeline) const {
  std::vector<SentimentEntry> result;
  result.reserve(timeline.size());
  for (const auto& entry : timeline) {
    SentimentEntry s;
    s.time_seconds = entry.start_seconds();
    s.emotion = entry.emotion();
    s.value = entry.classified ? emotion_value(entry.emotion()) : 0.0f;
    s.score = map_entry(entry);
    s.category = categorize(s.score);
    result.push_back(s);
  }
  return result;
}

SentimentSummary SentimentMapper::summarize(const std::vector<SentimentEntry>& entries,
                                            const std::vector<double>& weights) const {
  EMOTRACE_CHECK_MSG(entries.size() == weights.size(), ErrorCode::InvalidParameter,
                     "Sentiment entries and weights differ in length");

  std::vector<float> scores(entries.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    scores[i] = entries[i].score;
  }

  SentimentSummary summary;
  summary.score = clamp(static_cast<float>(weighted_mean(scores.data(), weights.data(),
                                                         scores.size())),
                        -1.0f, 1.0f);
  summary.category = categorize(summary.score);

  double total = total_coverage(weights);
  if (total <= 0.0) return summary;

  // Breakdown follows the label's category, not the confidence-weighted score
  for (size_t i = 0; i < entries.size(); ++i) {
    double pct = weights[i] / total * 100.0;
    switch (emotion_polarity(entries[i].emotion)) {
      case Polarity::Positive:
        summary.breakdown.positive += pct;
        break;
      case Polarity::Negative:
        summary.breakdown.negative += pct;
        break;
      default:
        summary.breakdown.neutral += pct;
        break;
    }
  }
  return summary;
}

SentimentSummary SentimentMapper::summarize(const std::vector<TimelineEntry>& timeline) const {
  return summarize(map_timeline(timeline), coverage_weights(timeline));
}

}  // namespace emotrace
