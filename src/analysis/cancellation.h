#pragma once

/// @file cancellation.h
/// @brief Cooperative cancellation for in-flight analyses.

#include <atomic>
#include <memory>

#include "util/exception.h"

namespace emotrace {

/// @brief Shared cancellation flag.
/// @details Copies share one flag, so a caller keeps a copy and cancels while the
/// pipeline polls another. A default-constructed token is never cancelled unless
/// cancel() is called on it or one of its copies.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  /// @brief Requests cancellation.
  void cancel() { flag_->store(true, std::memory_order_release); }

  /// @brief Returns true once cancel() has been called on any copy.
  bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

  /// @brief Throws AnalysisCancelled if cancellation was requested.
  void throw_if_cancelled() const {
    if (is_cancelled()) {
      throw AnalysisCancelled();
    }
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace emotrace
