#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "outcome/outcome.h"
#include "supervise/outcome_race.h"
#include "supervise/worker.h"

namespace script_runner {

/**
 * Process Watchdog - enforces a hard deadline on one worker.
 *
 * Supervise() arms the hard timer before the worker starts, then races the
 * worker's natural completion against timer expiry through an OutcomeRace.
 * Whichever resolves first decides the outcome. When the timer wins the
 * worker is killed and reaped before Supervise() returns, so no worker
 * outlives its request.
 *
 * A watchdog supervises a single request.
 */
class ProcessWatchdog {
 public:
  explicit ProcessWatchdog(std::chrono::milliseconds hard_timeout,
                           uint64_t request_id = 0);

  ProcessWatchdog(const ProcessWatchdog&) = delete;
  ProcessWatchdog& operator=(const ProcessWatchdog&) = delete;

  /**
   * Run the script on the worker under the hard deadline.
   *
   * Start failure and unconfirmed termination become KillError; a killed
   * worker becomes Timeout; otherwise the worker's own outcome is returned.
   */
  ExecutionOutcome Supervise(Worker& worker, const std::string& script);

  /**
   * Lifecycle state of the supervised request.
   */
  RequestState State() const { return lifecycle_.State(); }

 private:
  std::chrono::milliseconds hard_timeout_;
  uint64_t request_id_;
  RequestLifecycle lifecycle_;
};

}  // namespace script_runner
