#pragma once

/// @file math_utils.h
/// @brief Numeric helpers shared by the analysis stages.

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <vector>

namespace emotrace {

/// @brief Clamps a value between min and max.
/// @tparam T Numeric type
/// @param value Value to clamp
/// @param min_val Minimum bound
/// @param max_val Maximum bound
/// @return Clamped value
template <typename T>
T clamp(T value, T min_val, T max_val) {
  return std::max(min_val, std::min(value, max_val));
}

/// @brief Returns the index of the maximum element.
/// @details Ties resolve to the lowest index.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Index of maximum element (0 if empty)
template <typename T>
size_t argmax(const T* data, size_t size) {
  if (size == 0) return 0;
  return std::distance(data, std::max_element(data, data + size));
}

/// @brief Computes the arithmetic mean.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Mean value (0 if empty)
template <typename T>
T mean(const T* data, size_t size) {
  if (size == 0) return T{0};
  T sum = std::accumulate(data, data + size, T{0});
  return sum / static_cast<T>(size);
}

/// @brief Computes the population standard deviation.
/// @tparam T Numeric type
/// @param data Pointer to data array
/// @param size Number of elements
/// @return Standard deviation (0 if size < 2)
template <typename T>
T stddev(const T* data, size_t size) {
  if (size < 2) return T{0};
  T m = mean(data, size);
  T sum_sq = T{0};
  for (size_t i = 0; i < size; ++i) {
    T diff = data[i] - m;
    sum_sq += diff * diff;
  }
  return std::sqrt(sum_sq / static_cast<T>(size));
}

/// @brief Computes a weighted mean.
/// @param values Values
/// @param weights Non-negative weights (same length as values)
/// @param size Number of elements
/// @return Weighted mean (0 if total weight is zero)
double weighted_mean(const float* values, const double* weights, size_t size);

/// @brief Applies softmax in-place.
/// @param data Logits, overwritten with probabilities summing to 1
/// @param size Number of elements
void softmax(float* data, size_t size);

}  // namespace emotrace
