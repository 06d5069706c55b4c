#pragma once

/// @file classifier.h
/// @brief Function-shaped emotion classifier capability.

#include <cstddef>
#include <functional>

#include "util/types.h"

namespace emotrace {

/// @brief Classifies one window of mono samples.
/// @details Returns a probability for each Emotion in canonical order. Implementations
/// must be safe to call concurrently when the timeline is built with several threads.
/// Any exception thrown is reported as a ClassificationError for that window.
using ClassifyFn =
    std::function<EmotionScores(const float* samples, size_t size, int sample_rate)>;

}  // namespace emotrace
