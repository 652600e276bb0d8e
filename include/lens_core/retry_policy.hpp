#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

#include "lens_core/cancellation.hpp"
#include "lens_core/errors.hpp"

namespace lens_core {

class RetryCancelledError : public std::exception {
 public:
  explicit RetryCancelledError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Bounded exponential backoff for collaborator calls.
 *
 * Only CollaboratorError with FailureKind::Transient is retried. Fatal and
 * invalid-input failures, and any other exception, propagate on the first
 * occurrence. When the attempts are exhausted the last transient error is
 * rethrown unchanged.
 */
class RetryPolicy {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RetryPolicy(int max_attempts,
              std::chrono::milliseconds initial_backoff,
              double multiplier = 2.0,
              std::chrono::milliseconds max_backoff = std::chrono::seconds(30),
              Sleeper sleeper = {});

  // Policy that calls the operation exactly once.
  static RetryPolicy no_retry();

  template <typename Fn>
  auto run(const std::string &operation, Fn &&fn, const CancellationToken *cancel = nullptr) const
      -> decltype(fn()) {
    std::chrono::milliseconds backoff = initial_backoff_;
    for (int attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const CollaboratorError &e) {
        if (!e.is_retryable() || attempt >= max_attempts_) {
          throw;
        }
        std::cerr << "[Retry] " << operation << " failed (attempt " << attempt << "/"
                  << max_attempts_ << "): " << e.what() << ". Retrying in " << backoff.count()
                  << "ms" << std::endl;
      }
      if (cancel && cancel->is_cancelled()) {
        throw RetryCancelledError(operation + " cancelled while waiting to retry");
      }
      sleeper_(backoff);
      backoff = next_backoff(backoff);
    }
  }

  int max_attempts() const {
    return max_attempts_;
  }

  std::chrono::milliseconds next_backoff(std::chrono::milliseconds current) const;

 private:
  int max_attempts_;
  std::chrono::milliseconds initial_backoff_;
  double multiplier_;
  std::chrono::milliseconds max_backoff_;
  Sleeper sleeper_;
};

}  // namespace lens_core
