#pragma once

/// @file quick.h
/// @brief Simple function API for quick emotion analysis.
/// @details Stateless functions that run the pipeline with default configuration and the
/// process-wide default classifier. Input is mono PCM at any sample rate; it is resampled
/// to the analysis rate first.

#include <cstddef>
#include <vector>

#include "analysis/emotion_pipeline.h"

namespace emotrace {
namespace quick {

/// @brief Classifies the whole recording once.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Dominant emotion and its confidence
QuickResult detect_emotion(const float* samples, size_t size, int sample_rate);

/// @brief Builds the per-window emotion timeline.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Timeline entries ordered by start time
std::vector<TimelineEntry> emotion_timeline(const float* samples, size_t size, int sample_rate);

/// @brief Returns the overall sentiment score in [-1, 1].
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
float sentiment_score(const float* samples, size_t size, int sample_rate);

/// @brief Performs complete emotion analysis.
/// @param samples Pointer to audio samples (mono, float32)
/// @param size Number of samples
/// @param sample_rate Sample rate in Hz
/// @return Complete analysis report
AnalysisReport analyze(const float* samples, size_t size, int sample_rate);

}  // namespace quick
}  // namespace emotrace
