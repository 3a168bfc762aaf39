#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "js/interrupt_token.h"

namespace script_runner {

/**
 * InterruptController arms a timer on its own thread and, on expiry,
 * requests the interpreter to abort via an InterruptToken.
 *
 * - Disarm() before expiry never fires.
 * - Disarm() is idempotent and runs from the destructor.
 * - The token is requested at most once.
 */
class InterruptController {
 public:
  InterruptController() = default;
  ~InterruptController();

  InterruptController(const InterruptController&) = delete;
  InterruptController& operator=(const InterruptController&) = delete;

  /**
   * Start the timer. Throws std::logic_error if already armed.
   */
  void Arm(InterruptToken& token, std::chrono::milliseconds timeout);

  /**
   * Stop the timer and join its thread.
   */
  void Disarm();

  /**
   * True if the timer expired and requested the interrupt.
   */
  bool Fired() const;

 private:
  void TimerLoop(InterruptToken* token, std::chrono::steady_clock::time_point deadline);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::thread timer_;
  bool armed_ = false;
  bool disarmed_ = false;
  bool fired_ = false;
};

}  // namespace script_runner
