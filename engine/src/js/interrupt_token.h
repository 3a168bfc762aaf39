#pragma once

#include <atomic>

namespace script_runner {

/**
 * Cross-thread abort request observed by the interpreter at its
 * interruption checkpoints.
 *
 * Single-shot: once requested it stays requested.
 */
class InterruptToken {
 public:
  InterruptToken() = default;
  InterruptToken(const InterruptToken&) = delete;
  InterruptToken& operator=(const InterruptToken&) = delete;

  /**
   * Request an abort. Returns true only for the first request.
   */
  bool Request() { return !requested_.exchange(true, std::memory_order_acq_rel); }

  bool IsRequested() const { return requested_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> requested_{false};
};

}  // namespace script_runner
