/// @file quick.cpp
/// @brief Implementation of simple function API.

#include "quick.h"

#include "core/normalizer.h"

namespace emotrace {
namespace quick {

namespace {

AudioBuffer normalize(const float* samples, size_t size, int sample_rate) {
  return AudioNormalizer().normalize_samples(samples, size, 1, sample_rate);
}

}  // namespace

QuickResult detect_emotion(const float* samples, size_t size, int sample_rate) {
  return EmotionPipeline().quick_analyze(normalize(samples, size, sample_rate));
}

std::vector<TimelineEntry> emotion_timeline(const float* samples, size_t size, int sample_rate) {
  return analyze(samples, size, sample_rate).timeline();
}

float sentiment_score(const float* samples, size_t size, int sample_rate) {
  return analyze(samples, size, sample_rate).sentiment().score;
}

AnalysisReport analyze(const float* samples, size_t size, int sample_rate) {
  EmotionPipeline pipeline;
  return pipeline.analyze(normalize(samples, size, sample_rate));
}

}  // namespace quick
}  // namespace emotrace
