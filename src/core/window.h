#pragma once

/// @file window.h
/// @brief Tapering windows for frame analysis.

#include <vector>

namespace emotrace {

/// @brief Creates a periodic Hann (raised cosine) window.
/// @param length Window length in samples
/// @return Vector containing window coefficients
std::vector<float> hann_window(int length);

/// @brief Returns a cached Hann window (thread-local cache).
/// @param length Window length in samples
/// @return Const reference to cached window coefficients
const std::vector<float>& hann_window_cached(int length);

/// @brief Multiplies a frame by a window into an output buffer.
/// @param frame Input samples
/// @param window Window coefficients
/// @param size Number of samples (frame, window and output share it)
/// @param output Windowed samples
void apply_window(const float* frame, const float* window, int size, float* output);

}  // namespace emotrace
