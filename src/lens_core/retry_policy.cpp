#include "lens_core/retry_policy.hpp"

#include <algorithm>
#include <thread>

namespace lens_core {

RetryPolicy::RetryPolicy(int max_attempts,
                         std::chrono::milliseconds initial_backoff,
                         double multiplier,
                         std::chrono::milliseconds max_backoff,
                         Sleeper sleeper)
    : max_attempts_(max_attempts),
      initial_backoff_(initial_backoff),
      multiplier_(multiplier),
      max_backoff_(max_backoff),
      sleeper_(std::move(sleeper)) {
  if (max_attempts_ < 1) {
    throw ConfigurationError("RetryPolicy needs at least one attempt");
  }
  if (multiplier_ < 1.0) {
    throw ConfigurationError("RetryPolicy backoff multiplier must be >= 1");
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
  }
}

RetryPolicy RetryPolicy::no_retry() {
  return RetryPolicy(1, std::chrono::milliseconds(0));
}

std::chrono::milliseconds RetryPolicy::next_backoff(std::chrono::milliseconds current) const {
  auto scaled = std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(static_cast<double>(current.count()) * multiplier_));
  return std::min(scaled, max_backoff_);
}

}  // namespace lens_core
