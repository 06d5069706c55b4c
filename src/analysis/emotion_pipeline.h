#pragma once

/// @file emotion_pipeline.h
/// @brief End-to-end emotion timeline analysis facade.

#include <cstdint>
#include <string>
#include <vector>

#include "analysis/cancellation.h"
#include "analysis/report_aggregator.h"
#include "analysis/sentiment_mapper.h"
#include "analysis/timeline_builder.h"
#include "analysis/transition_detector.h"
#include "classify/classifier.h"
#include "core/audio_buffer.h"
#include "core/normalizer.h"
#include "core/segmenter.h"

namespace emotrace {

/// @brief Configuration of every pipeline stage.
struct PipelineConfig {
  NormalizerConfig normalizer;
  SegmenterConfig segmenter;
  TimelineConfig timeline;
  TransitionConfig transitions;
  SentimentConfig sentiment;
};

/// @brief Whole-buffer prediction.
struct QuickResult {
  Emotion emotion = Emotion::Neutral;
  float confidence = 0.0f;
  EmotionScores scores{};
};

/// @brief Runs normalization, segmentation, classification and aggregation.
/// @details Stages run in a fixed order and every failure propagates as a typed
/// exception, so no partial report is ever returned. A pipeline holds no per-analysis
/// state and may analyze several buffers in turn.
class EmotionPipeline {
 public:
  /// @brief Constructs a pipeline using the process-wide default classifier.
  /// @param config Stage configuration
  /// @throws EmotraceException(InvalidParameter) if a stage configuration is invalid
  explicit EmotionPipeline(const PipelineConfig& config = PipelineConfig());

  /// @brief Constructs a pipeline with an injected classifier.
  EmotionPipeline(const PipelineConfig& config, ClassifyFn classify);

  /// @brief Sets progress callback for analysis progress reporting.
  /// @param callback Callback function receiving (progress, stage) parameters
  void set_progress_callback(ProgressCallback callback);

  /// @brief Analyzes a normalized buffer.
  /// @param audio Mono audio
  /// @param token Cancellation token checked before each window
  /// @throws EmptyAudioError if the buffer is empty
  /// @throws InvalidWindowConfigError, ClassificationError, ReportConsistencyError,
  /// AnalysisCancelled
  AnalysisReport analyze(const AudioBuffer& audio,
                         const CancellationToken& token = CancellationToken()) const;

  /// @brief Normalizes a file and analyzes it.
  AnalysisReport analyze_file(const std::string& path,
                              const CancellationToken& token = CancellationToken()) const;

  /// @brief Normalizes encoded bytes and analyzes them.
  AnalysisReport analyze_memory(const uint8_t* data, size_t size,
                                const CancellationToken& token = CancellationToken()) const;

  /// @brief Normalizes an encoded file or byte stream.
  AudioBuffer load_file(const std::string& path) const;
  AudioBuffer load_memory(const uint8_t* data, size_t size) const;

  /// @brief Returns the analysis windows of a buffer.
  std::vector<Window> segment(const AudioBuffer& audio) const;

  /// @brief Classifies the whole buffer as one window.
  /// @throws EmptyAudioError if the buffer is empty
  /// @throws ClassificationError if the classifier fails
  QuickResult quick_analyze(const AudioBuffer& audio) const;

  const PipelineConfig& config() const { return config_; }

 private:
  void report_progress(float progress, const char* stage) const;

  PipelineConfig config_;
  ClassifyFn classify_;
  AudioNormalizer normalizer_;
  Segmenter segmenter_;
  SentimentMapper sentiment_;
  TransitionDetector transitions_;
  ProgressCallback progress_callback_;
};

}  // namespace emotrace
