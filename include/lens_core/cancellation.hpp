#pragma once

#include <atomic>

namespace lens_core {

// Cooperative cancellation flag shared between a long-running job and
// whoever wants to stop it. Checked between batches, never mid-write.
class CancellationToken {
 public:
  void cancel() {
    cancelled_.store(true);
  }

  bool is_cancelled() const {
    return cancelled_.load();
  }

  void reset() {
    cancelled_.store(false);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace lens_core
