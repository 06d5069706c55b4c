#pragma once

/// @file emotrace.h
/// @brief Main header for libemotrace - speech emotion timeline analysis.
/// @details Include this file to access all libemotrace functionality.

// Version information
#define EMOTRACE_VERSION_MAJOR 1
#define EMOTRACE_VERSION_MINOR 0
#define EMOTRACE_VERSION_PATCH 0
#define EMOTRACE_VERSION_STRING "1.0.0"

// Utility
#include "util/exception.h"
#include "util/json_writer.h"
#include "util/math_utils.h"
#include "util/time_format.h"
#include "util/types.h"

// Core
#include "core/audio_buffer.h"
#include "core/audio_io.h"
#include "core/fft.h"
#include "core/normalizer.h"
#include "core/resample.h"
#include "core/segmenter.h"
#include "core/window.h"

// Classification
#include "classify/classifier.h"
#include "classify/classifier_registry.h"
#include "classify/prosodic_classifier.h"

// Analysis
#include "analysis/cancellation.h"
#include "analysis/coverage.h"
#include "analysis/emotion_pipeline.h"
#include "analysis/report_aggregator.h"
#include "analysis/report_json.h"
#include "analysis/sentiment_mapper.h"
#include "analysis/timeline_builder.h"
#include "analysis/transition_detector.h"

// Quick API
#include "quick.h"

namespace emotrace {

/// @brief Returns the library version string.
/// @return Version string (e.g., "1.0.0")
inline const char* version() { return EMOTRACE_VERSION_STRING; }

/// @brief Returns the major version number.
inline int version_major() { return EMOTRACE_VERSION_MAJOR; }

/// @brief Returns the minor version number.
inline int version_minor() { return EMOTRACE_VERSION_MINOR; }

/// @brief Returns the patch version number.
inline int version_patch() { return EMOTRACE_VERSION_PATCH; }

}  // namespace emotrace
