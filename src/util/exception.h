#pragma once

/// @file exception.h
/// @brief Exception classes for emotrace.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace emotrace {

/// @brief Base exception class for emotrace errors.
class EmotraceException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit EmotraceException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  EmotraceException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @brief Byte stream could not be decoded as a supported container.
class UnsupportedFormatError : public EmotraceException {
 public:
  explicit UnsupportedFormatError(const std::string& message)
      : EmotraceException(ErrorCode::UnsupportedFormat, message) {}
};

/// @brief Decoded audio has zero duration.
class EmptyAudioError : public EmotraceException {
 public:
  explicit EmptyAudioError(const std::string& message)
      : EmotraceException(ErrorCode::EmptyAudio, message) {}
};

/// @brief Window length / overlap do not satisfy 0 < overlap < length <= duration.
class InvalidWindowConfigError : public EmotraceException {
 public:
  explicit InvalidWindowConfigError(const std::string& message)
      : EmotraceException(ErrorCode::InvalidWindowConfig, message) {}
};

/// @brief Classification of one window failed.
/// @details Carries the time range of the failing window so the caller can retry it
/// or decide to abort the analysis.
class ClassificationError : public EmotraceException {
 public:
  ClassificationError(float start_seconds, float end_seconds, const std::string& message)
      : EmotraceException(ErrorCode::ClassificationFailed, message),
        start_seconds_(start_seconds),
        end_seconds_(end_seconds) {}

  /// @brief Returns the start of the failing window in seconds.
  float start_seconds() const { return start_seconds_; }

  /// @brief Returns the end of the failing window in seconds.
  float end_seconds() const { return end_seconds_; }

 private:
  float start_seconds_;
  float end_seconds_;
};

/// @brief Assembled report violates one of its internal invariants.
class ReportConsistencyError : public EmotraceException {
 public:
  explicit ReportConsistencyError(const std::string& message)
      : EmotraceException(ErrorCode::ReportInconsistent, message) {}
};

/// @brief Analysis was cancelled through a CancellationToken.
class AnalysisCancelled : public EmotraceException {
 public:
  AnalysisCancelled() : EmotraceException(ErrorCode::Cancelled) {}
};

/// @def EMOTRACE_CHECK
/// @brief Throws EmotraceException if condition is false.
#define EMOTRACE_CHECK(cond, code)   \
  do {                               \
    if (!(cond)) {                   \
      throw EmotraceException(code); \
    }                                \
  } while (0)

/// @def EMOTRACE_CHECK_MSG
/// @brief Throws EmotraceException with custom message if condition is false.
#define EMOTRACE_CHECK_MSG(cond, code, msg) \
  do {                                      \
    if (!(cond)) {                          \
      throw EmotraceException(code, msg);   \
    }                                       \
  } while (0)

}  // namespace emotrace
