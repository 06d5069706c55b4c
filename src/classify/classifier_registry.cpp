#include "classify/classifier_registry.h"

#include <memory>
#include <mutex>
#include <utility>

#include "classify/prosodic_classifier.h"

namespace emotrace {

namespace {

std::mutex g_classifier_mutex;
ClassifyFn g_default_classifier;

}  // namespace

ClassifyFn default_classifier() {
  std::lock_guard<std::mutex> lock(g_classifier_mutex);
  if (!g_default_classifier) {
    auto model = std::make_shared<const ProsodicClassifier>();
    g_default_classifier = [model](const float* samples, size_t size, int sample_rate) {
      return model->classify(samples, size, sample_rate);
    };
  }
  return g_default_classifier;
}

void set_default_classifier(ClassifyFn classify) {
  std::lock_guard<std::mutex> lock(g_classifier_mutex);
  g_default_classifier = std::move(classify);
}

void reset_default_classifier() {
  std::lock_guard<std::mutex> lock(g_classifier_mutex);
  g_default_classifier = nullptr;
}

bool default_classifier_initialized() {
  std::lock_guard<std::mutex> lock(g_classifier_mutex);
  return static_cast<bool>(g_default_classifier);
}

}  // namespace emotrace
