/// @file window.cpp
/// @brief Implementation of window functions.

#include "core/window.h"

#include <cmath>
#include <unordered_map>

namespace emotrace {

namespace {
constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

/// @brief Thread-local cache keyed by window length.
thread_local std::unordered_map<int, std::vector<float>> g_hann_cache;
}  // namespace

std::vector<float> hann_window(int length) {
  std::vector<float> window(length > 0 ? length : 0);
  for (int i = 0; i < length; ++i) {
    window[i] = 0.5f * (1.0f - std::cos(kTwoPi * i / length));
  }
  return window;
}

const std::vector<float>& hann_window_cached(int length) {
  auto it = g_hann_cache.find(length);
  if (it != g_hann_cache.end()) {
    return it->second;
  }
  return g_hann_cache.emplace(length, hann_window(length)).first->second;
}

void apply_window(const float* frame, const float* window, int size, float* output) {
  for (int i = 0; i < size; ++i) {
    output[i] = frame[i] * window[i];
  }
}

}  // namespace emotrace
