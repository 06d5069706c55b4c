#include "analysis/emotion_pipeline.h"

#include <utility>

#include "analysis/coverage.h"
#include "classify/classifier_registry.h"
#include "util/exception.h"

namespace emotrace {

namespace {

// Share of overall progress given to window classification
constexpr float kClassifyStart = 0.10f;
constexpr float kClassifySpan = 0.70f;

}  // namespace

EmotionPipeline::EmotionPipeline(const PipelineConfig& config)
    : EmotionPipeline(config, default_classifier()) {}

EmotionPipeline::EmotionPipeline(const PipelineConfig& config, ClassifyFn classify)
    : config_(config),
      classify_(std::move(classify)),
      normalizer_(config.normalizer),
      segmenter_(config.segmenter),
      sentiment_(config.sentiment),
      transitions_(config.transitions, sentiment_) {
  EMOTRACE_CHECK_MSG(static_cast<bool>(classify_), ErrorCode::InvalidParameter,
                     "EmotionPipeline requires a classifier");
}

void EmotionPipeline::set_progress_callback(ProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

void EmotionPipeline::report_progress(float progress, const char* stage) const {
  if (progress_callback_) {
    progress_callback_(progress, stage);
  }
}

AudioBuffer EmotionPipeline::load_file(const std::string& path) const {
  return normalizer_.normalize_file(path);
}

AudioBuffer EmotionPipeline::load_memory(const uint8_t* data, size_t size) const {
  return normalizer_.normalize(data, size);
}

std::vector<Window> EmotionPipeline::segment(const AudioBuffer& audio) const {
  if (audio.empty()) {
    throw EmptyAudioError("Audio has zero duration");
  }
  return segmenter_.segment(audio);
}

AnalysisReport EmotionPipeline::analyze(const AudioBuffer& audio,
                                        const CancellationToken& token) const {
  report_progress(0.0f, "validating");
  token.throw_if_cancelled();

  report_progress(0.05f, "segmenting");
  std::vector<Window> windows = segment(audio);

  report_progress(kClassifyStart, "classifying");
  TimelineBuilder builder(classify_, config_.timeline);
  if (progress_callback_) {
    builder.set_progress_callback([this](float progress, const char* stage) {
      report_progress(kClassifyStart + kClassifySpan * progress, stage);
    });
  }
  std::vector<TimelineEntry> timeline = builder.build(windows, token);
  token.throw_if_cancelled();

  report_progress(0.85f, "transitions");
  std::vector<Transition> transitions = transitions_.detect(timeline);

  report_progress(0.90f, "sentiment");
  std::vector<SentimentEntry> sentiment_timeline = sentiment_.map_timeline(timeline);
  SentimentSummary sentiment = sentiment_.summarize(sentiment_timeline, coverage_weights(timeline));

  report_progress(0.95f, "aggregating");
  ReportMetadata metadata;
  metadata.duration = audio.duration();
  metadata.total_segments = windows.size();
  metadata.sample_rate = audio.sample_rate();

  AnalysisReport report =
      ReportAggregator().aggregate(metadata, std::move(timeline), std::move(transitions),
                                   std::move(sentiment_timeline), sentiment);

  report_progress(1.0f, "complete");
  return report;
}

AnalysisReport EmotionPipeline::analyze_file(const std::string& path,
                                             const CancellationToken& token) const {
  report_progress(0.0f, "loading");
  return analyze(load_file(path), token);
}

AnalysisReport EmotionPipeline::analyze_memory(const uint8_t* data, size_t size,
                                               const CancellationToken& token) const {
  report_progress(0.0f, "loading");
  return analyze(load_memory(data, size), token);
}

QuickResult EmotionPipeline::quick_analyze(const AudioBuffer& audio) const {
  if (audio.empty()) {
    throw EmptyAudioError("Audio has zero duration");
  }

  Window whole;
  whole.start_sample = 0;
  whole.end_sample = audio.size();
  whole.start_seconds = 0.0f;
  whole.end_seconds = audio.duration();
  whole.audio = audio;

  TimelineBuilder builder(classify_, config_.timeline);
  EmotionPrediction prediction = builder.classify_window(whole);

  QuickResult result;
  result.emotion = prediction.emotion;
  result.confidence = prediction.confidence;
  result.scores = prediction.scores;
  return result;
}

}  // namespace emotrace
