#include "js/interrupt_controller.h"

#include <stdexcept>

namespace script_runner {

InterruptController::~InterruptController() {
  Disarm();
}

void InterruptController::Arm(InterruptToken& token, std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mu_);
  if (armed_) {
    throw std::logic_error("InterruptController already armed");
  }
  armed_ = true;
  disarmed_ = false;
  fired_ = false;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  timer_ = std::thread(&InterruptController::TimerLoop, this, &token, deadline);
}

void InterruptController::TimerLoop(InterruptToken* token,
                                    std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mu_);
  if (cv_.wait_until(lock, deadline, [this] { return disarmed_; })) {
    return;
  }
  fired_ = true;
  token->Request();
}

void InterruptController::Disarm() {
  std::thread timer;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!armed_) {
      return;
    }
    armed_ = false;
    disarmed_ = true;
    timer = std::move(timer_);
  }
  cv_.notify_all();
  if (timer.joinable()) {
    timer.join();
  }
}

bool InterruptController::Fired() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fired_;
}

}  // namespace script_runner
