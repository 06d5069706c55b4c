#include "analysis/timeline_builder.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include "util/exception.h"
#include "util/math_utils.h"
#include "util/time_format.h"

namespace emotrace {

namespace {

std::string window_label(const Window& window) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "[%.3fs, %.3fs)", window.start_seconds, window.end_seconds);
  return buf;
}

/// @brief Outcome of one window, written by exactly one worker.
struct Slot {
  bool done = false;
  EmotionPrediction prediction;
  std::exception_ptr error;
};

}  // namespace

const char* failure_policy_name(FailurePolicy policy) {
  return policy == FailurePolicy::Placeholder ? "placeholder" : "abort";
}

EmotionPrediction make_prediction(const EmotionScores& scores) {
  EmotionPrediction p;
  size_t best = argmax(scores.data(), scores.size());
  p.emotion = static_cast<Emotion>(best);
  p.confidence = scores[best];
  p.scores = scores;
  return p;
}

TimelineEntry make_gap_entry(size_t index, const Window& window) {
  TimelineEntry entry;
  entry.index = index;
  entry.window = window;
  entry.start_formatted = format_timestamp(window.start_seconds);
  entry.end_formatted = format_timestamp(window.end_seconds);
  entry.classified = false;
  return entry;
}

TimelineBuilder::TimelineBuilder(ClassifyFn classify, const TimelineConfig& config)
    : classify_(std::move(classify)), config_(config) {
  EMOTRACE_CHECK_MSG(static_cast<bool>(classify_), ErrorCode::InvalidParameter,
                     "TimelineBuilder requires a classifier");
  EMOTRACE_CHECK_MSG(config_.n_threads >= 0, ErrorCode::InvalidParameter,
                     "n_threads must be >= 0: " + std::to_string(config_.n_threads));
  EMOTRACE_CHECK_MSG(config_.score_tolerance >= 0.0f, ErrorCode::InvalidParameter,
                     "score_tolerance must be >= 0");
}

void TimelineBuilder::set_progress_callback(ProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

void TimelineBuilder::validate_scores(const Window& window, const EmotionScores& scores) const {
  double sum = 0.0;
  for (size_t i = 0; i < scores.size(); ++i) {
    float s = scores[i];
    if (!std::isfinite(s) || s < 0.0f || s > 1.0f) {
      throw ClassificationError(window.start_seconds, window.end_seconds,
                                "Classifier returned an invalid probability for '" +
                                    std::string(emotion_name(kAllEmotions[i])) + "' in window " +
                                    window_label(window));
    }
    sum += s;
  }
  if (std::abs(sum - 1.0) > config_.score_tolerance) {
    throw ClassificationError(window.start_seconds, window.end_seconds,
                              "Classifier probabilities sum to " + std::to_string(sum) +
                                  " in window " + window_label(window));
  }
}

EmotionPrediction TimelineBuilder::classify_window(const Window& window) const {
  EmotionScores scores;
  try {
    scores = classify_(window.audio.data(), window.audio.size(), window.audio.sample_rate());
  } catch (const std::exception& e) {
    throw ClassificationError(window.start_seconds, window.end_seconds,
                              "Classification failed in window " + window_label(window) + ": " +
                                  e.what());
  } catch (...) {
    throw ClassificationError(window.start_seconds, window.end_seconds,
                              "Classification failed in window " + window_label(window) +
                                  ": unknown error");
  }
  validate_scores(window, scores);
  return make_prediction(scores);
}

std::vector<TimelineEntry> TimelineBuilder::build(const std::vector<Window>& windows,
                                                  const CancellationToken& token) const {
  const size_t total = windows.size();
  std::vector<Slot> slots(total);

  std::atomic<size_t> next{0};
  std::atomic<bool> stop{false};
  std::atomic<size_t> completed{0};
  std::mutex progress_mutex;
  std::exception_ptr callback_error;
  const bool abort_on_failure = config_.failure_policy == FailurePolicy::Abort;

  // Indices are claimed in increasing order, so when a worker fails on window i every
  // window before i has already been claimed and will finish.
  auto worker = [&]() {
    while (!stop.load(std::memory_order_acquire)) {
      if (token.is_cancelled()) {
        stop.store(true, std::memory_order_release);
        break;
      }
      size_t i = next.fetch_add(1);
      if (i >= total) break;

      Slot& slot = slots[i];
      try {
        slot.prediction = classify_window(windows[i]);
      } catch (const ClassificationError&) {
        slot.error = std::current_exception();
        if (abort_on_failure) stop.store(true, std::memory_order_release);
      }
      slot.done = true;

      size_t done = completed.fetch_add(1) + 1;
      if (progress_callback_) {
        // Callbacks are serialized; one that throws stops every worker and is rethrown after join
        std::lock_guard<std::mutex> lock(progress_mutex);
        if (callback_error) break;
        try {
          progress_callback_(static_cast<float>(done) / static_cast<float>(total), "classifying");
        } catch (...) {
          callback_error = std::current_exception();
          stop.store(true, std::memory_order_release);
        }
      }
    }
  };

  size_t n_threads = config_.n_threads == 0
                         ? std::max(1u, std::thread::hardware_concurrency())
                         : static_cast<size_t>(config_.n_threads);
  n_threads = std::min(n_threads, std::max<size_t>(total, 1));

  if (n_threads <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(n_threads);
    try {
      for (size_t t = 0; t < n_threads; ++t) {
        threads.emplace_back(worker);
      }
    } catch (const std::system_error&) {
      stop.store(true, std::memory_order_release);
      for (auto& th : threads) {
        th.join();
      }
      throw;
    }
    for (auto& th : threads) {
      th.join();
    }
  }

  if (callback_error) {
    std::rethrow_exception(callback_error);
  }

  std::vector<TimelineEntry> timeline;
  timeline.reserve(total);
  for (size_t i = 0; i < total; ++i) {
    Slot& slot = slots[i];
    if (slot.error && abort_on_failure) {
      std::rethrow_exception(slot.error);
    }
    if (!slot.done) {
      // Only cancellation leaves a window unclaimed before an earlier failure
      throw AnalysisCancelled();
    }
    if (slot.error) {
      timeline.push_back(make_gap_entry(i, windows[i]));
      continue;
    }

    TimelineEntry entry;
    entry.index = i;
    entry.window = windows[i];
    entry.prediction = slot.prediction;
    entry.start_formatted = format_timestamp(windows[i].start_seconds);
    entry.end_formatted = format_timestamp(windows[i].end_seconds);
    timeline.push_back(std::move(entry));
  }
  return timeline;
}

}  // namespace emotrace
