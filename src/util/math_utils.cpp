/// @file math_utils.cpp
/// @brief Implementation of math utility functions.

#include "util/math_utils.h"

#include <algorithm>
#include <cmath>

namespace emotrace {

double weighted_mean(const float* values, const double* weights, size_t size) {
  double sum = 0.0;
  double total_weight = 0.0;
  for (size_t i = 0; i < size; ++i) {
    sum += static_cast<double>(values[i]) * weights[i];
    total_weight += weights[i];
  }
  if (total_weight <= 0.0) return 0.0;
  return sum / total_weight;
}

void softmax(float* data, size_t size) {
  if (size == 0) return;

  // Shift by max for numerical stability
  float max_val = *std::max_element(data, data + size);
  float sum = 0.0f;
  for (size_t i = 0; i < size; ++i) {
    data[i] = std::exp(data[i] - max_val);
    sum += data[i];
  }
  for (size_t i = 0; i < size; ++i) {
    data[i] /= sum;
  }
}

}  // namespace emotrace
