#include "analysis/report_json.h"

#include "util/time_format.h"

namespace emotrace {

namespace {

constexpr int kScorePrecision = 3;
constexpr int kTimePrecision = 3;
constexpr int kPercentPrecision = 2;
constexpr int kDurationPrecision = 2;

}  // namespace

void write_scores(JsonWriter& json, const EmotionScores& scores) {
  json.begin_object();
  for (Emotion e : kAllEmotions) {
    json.kv(emotion_name(e), static_cast<double>(scores[emotion_index(e)]), kScorePrecision);
  }
  json.end_object();
}

void write_distribution(JsonWriter& json, const EmotionDistribution& distribution) {
  json.begin_object();
  for (Emotion e : kAllEmotions) {
    json.kv(emotion_name(e), distribution[emotion_index(e)], kPercentPrecision);
  }
  json.end_object();
}

void write_timeline(JsonWriter& json, const AnalysisReport& report) {
  const auto& timeline = report.timeline();
  const auto& sentiment = report.sentiment_timeline();

  json.begin_array();
  for (size_t i = 0; i < timeline.size(); ++i) {
    const TimelineEntry& entry = timeline[i];
    json.begin_object()
        .kv("segment_id", entry.index)
        .kv("start_formatted", entry.start_formatted)
        .kv("end_formatted", entry.end_formatted)
        .kv("start_seconds", static_cast<double>(entry.start_seconds()), kTimePrecision)
        .kv("end_seconds", static_cast<double>(entry.end_seconds()), kTimePrecision)
        .kv("emotion", emotion_name(entry.emotion()))
        .kv("confidence", static_cast<double>(entry.confidence()), kScorePrecision)
        .kv("classified", entry.classified)
        .key("distribution");
    write_scores(json, entry.prediction.scores);
    json.kv("sentiment", polarity_name(sentiment[i].category))
        .kv("sentiment_score", static_cast<double>(sentiment[i].score), kScorePrecision)
        .end_object();
  }
  json.end_array();
}

void write_transitions(JsonWriter& json, const std::vector<Transition>& transitions) {
  json.begin_array();
  for (const auto& t : transitions) {
    json.begin_object()
        .kv("time", t.time_formatted)
        .kv("time_seconds", static_cast<double>(t.time_seconds), kTimePrecision)
        .kv("from_emotion", emotion_name(t.from_emotion))
        .kv("to_emotion", emotion_name(t.to_emotion))
        .kv("from_confidence", static_cast<double>(t.from_confidence), kScorePrecision)
        .kv("to_confidence", static_cast<double>(t.to_confidence), kScorePrecision)
        .kv("confidence_change", static_cast<double>(t.confidence_change), kScorePrecision)
        .kv("is_significant", t.is_significant)
        .end_object();
  }
  json.end_array();
}

void write_sentiment(JsonWriter& json, const SentimentSummary& sentiment) {
  json.begin_object()
      .kv("score", static_cast<double>(sentiment.score), kScorePrecision)
      .kv("category", polarity_name(sentiment.category))
      .key("breakdown")
      .begin_object()
      .kv("positive", sentiment.breakdown.positive, kPercentPrecision)
      .kv("neutral", sentiment.breakdown.neutral, kPercentPrecision)
      .kv("negative", sentiment.breakdown.negative, kPercentPrecision)
      .end_object()
      .end_object();
}

void write_journey(JsonWriter& json, const JourneySummary& journey) {
  json.begin_object()
      .kv("primary_emotion", emotion_name(journey.primary_emotion))
      .kv("total_transitions", journey.total_transitions)
      .kv("stability_score", static_cast<double>(journey.stability_score), kScorePrecision)
      .key("dominant_emotions")
      .begin_array();
  for (const auto& d : journey.dominant_emotions) {
    json.begin_object()
        .kv("emotion", emotion_name(d.emotion))
        .kv("percentage", d.percentage, kPercentPrecision)
        .end_object();
  }
  json.end_array()
      .kv("emotional_variability", journey.high_variability ? "high" : "low")
      .end_object();
}

void write_windows(JsonWriter& json, const std::vector<Window>& windows) {
  json.begin_array();
  for (size_t i = 0; i < windows.size(); ++i) {
    const Window& w = windows[i];
    json.begin_object()
        .kv("segment_id", i)
        .kv("start_formatted", format_timestamp(w.start_seconds))
        .kv("start_seconds", static_cast<double>(w.start_seconds), kTimePrecision)
        .kv("end_seconds", static_cast<double>(w.end_seconds), kTimePrecision)
        .kv("start_sample", w.start_sample)
        .kv("end_sample", w.end_sample)
        .end_object();
  }
  json.end_array();
}

void write_report(JsonWriter& json, const AnalysisReport& report) {
  const ReportMetadata& meta = report.metadata();

  json.begin_object()
      .key("metadata")
      .begin_object()
      .kv("duration", static_cast<double>(meta.duration), kDurationPrecision)
      .kv("total_segments", meta.total_segments)
      .kv("sample_rate", meta.sample_rate)
      .end_object()
      .key("timeline");
  write_timeline(json, report);

  json.key("transitions");
  write_transitions(json, report.transitions());

  json.key("distribution");
  write_distribution(json, report.distribution());

  json.key("confidence_curve").begin_array();
  for (const auto& p : report.confidence_curve()) {
    json.begin_object()
        .kv("time", p.time)
        .kv("time_seconds", static_cast<double>(p.time_seconds), kTimePrecision)
        .kv("confidence", static_cast<double>(p.confidence), kScorePrecision)
        .kv("emotion", emotion_name(p.emotion))
        .end_object();
  }
  json.end_array();

  json.key("heatmap_data").begin_array();
  for (const auto& row : report.heatmap()) {
    json.begin_object()
        .kv("time", row.time)
        .kv("time_seconds", static_cast<double>(row.time_seconds), kTimePrecision);
    for (Emotion e : kAllEmotions) {
      json.kv(emotion_name(e), static_cast<double>(row.intensities[emotion_index(e)]),
              kScorePrecision);
    }
    json.end_object();
  }
  json.end_array();

  json.key("sentiment_analysis");
  write_sentiment(json, report.sentiment());

  json.key("journey_analysis");
  write_journey(json, report.journey());

  json.end_object();
}

std::string to_json(const AnalysisReport& report, int indent) {
  JsonWriter json(indent);
  write_report(json, report);
  return json.str();
}

}  // namespace emotrace
