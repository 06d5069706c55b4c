#pragma once

/// @file classifier_registry.h
/// @brief Process-wide default classifier with lazy initialization.

#include "classify/classifier.h"

namespace emotrace {

/// @brief Returns the process-wide default classifier.
/// @details The first call creates a ProsodicClassifier unless one was installed with
/// set_default_classifier(). Thread-safe.
ClassifyFn default_classifier();

/// @brief Installs a classifier as the process-wide default.
/// @param classify Classifier to use (an empty function restores lazy creation)
void set_default_classifier(ClassifyFn classify);

/// @brief Drops the default classifier so the next call recreates it.
void reset_default_classifier();

/// @brief Returns true if a default classifier currently exists.
bool default_classifier_initialized();

}  // namespace emotrace
