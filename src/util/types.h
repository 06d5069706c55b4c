#pragma once

/// @file types.h
/// @brief Common type definitions for emotrace.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace emotrace {

/// @brief Number of emotion classes produced by a classifier.
constexpr size_t kEmotionCount = 7;

/// @brief Emotion labels.
/// @details The enumerator order is the canonical label order used for score arrays
/// and for every emotion-keyed mapping in reports.
enum class Emotion : int {
  Happy = 0,
  Sad = 1,
  Angry = 2,
  Neutral = 3,
  Fear = 4,
  Disgust = 5,
  Surprise = 6,
};

/// @brief Per-class probability vector indexed by Emotion.
using EmotionScores = std::array<float, kEmotionCount>;

/// @brief Sentiment category.
enum class Polarity {
  Positive,
  Neutral,
  Negative,
};

/// @brief Error codes for library operations.
enum class ErrorCode : int {
  Ok = 0,
  FileNotFound,
  UnsupportedFormat,
  EmptyAudio,
  DurationExceeded,
  InvalidParameter,
  InvalidWindowConfig,
  ClassificationFailed,
  ReportInconsistent,
  Cancelled,
};

/// @brief All emotions in canonical order.
constexpr std::array<Emotion, kEmotionCount> kAllEmotions = {
    Emotion::Happy, Emotion::Sad,     Emotion::Angry,    Emotion::Neutral,
    Emotion::Fear,  Emotion::Disgust, Emotion::Surprise,
};

/// @brief Returns the label of an emotion.
/// @param e Emotion
/// @return Lowercase label (e.g., "happy")
inline const char* emotion_name(Emotion e) {
  static const char* names[] = {"happy", "sad", "angry", "neutral", "fear", "disgust", "surprise"};
  return names[static_cast<int>(e)];
}

/// @brief Parses an emotion label.
/// @param name Lowercase label
/// @param out Parsed emotion
/// @return False if the label is unknown
bool parse_emotion(const std::string& name, Emotion& out);

/// @brief Returns the name of a polarity.
/// @param p Polarity
/// @return "positive", "neutral" or "negative"
inline const char* polarity_name(Polarity p) {
  switch (p) {
    case Polarity::Positive:
      return "positive";
    case Polarity::Negative:
      return "negative";
    default:
      return "neutral";
  }
}

/// @brief Returns the score array index of an emotion.
inline size_t emotion_index(Emotion e) { return static_cast<size_t>(e); }

/// @brief Returns error message for an error code.
/// @param code Error code
/// @return Human-readable error message
inline const char* error_message(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:
      return "OK";
    case ErrorCode::FileNotFound:
      return "File not found";
    case ErrorCode::UnsupportedFormat:
      return "Unsupported audio format";
    case ErrorCode::EmptyAudio:
      return "Audio has zero duration";
    case ErrorCode::DurationExceeded:
      return "Audio exceeds maximum duration";
    case ErrorCode::InvalidParameter:
      return "Invalid parameter";
    case ErrorCode::InvalidWindowConfig:
      return "Invalid window configuration";
    case ErrorCode::ClassificationFailed:
      return "Classification failed";
    case ErrorCode::ReportInconsistent:
      return "Report consistency check failed";
    case ErrorCode::Cancelled:
      return "Analysis cancelled";
  }
  return "Unknown error";
}

}  // namespace emotrace
