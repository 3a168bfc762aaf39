#pragma once

#include <string>

#include "outcome/outcome.h"

namespace script_runner {

/**
 * Result of a termination request.
 */
struct KillResult {
  enum class Status {
    kKilled,         // the worker was running and is now terminated
    kAlreadyExited,  // nothing to kill; completion is already underway
    kFailed          // termination could not be confirmed
  };

  Status status;
  std::string detail;  // for kFailed
};

/**
 * Base interface for one execution attempt (subprocess or in-process).
 *
 * A worker is owned by exactly one ProcessWatchdog, which drives it as:
 *   Start() once, then Wait() on one thread and possibly Kill() on another.
 * Kill() must be safe to call concurrently with Wait(), and Wait() must
 * return once Kill() reports kKilled.
 */
class Worker {
 public:
  virtual ~Worker() = default;

  /**
   * Launch the execution of a script.
   * Returns false and sets error_out if the worker could not be started.
   */
  virtual bool Start(const std::string& script, std::string* error_out) = 0;

  /**
   * Block until the worker finishes and return its outcome.
   * Malformed results become KillError.
   */
  virtual ExecutionOutcome Wait() = 0;

  /**
   * Forcibly terminate the worker.
   */
  virtual KillResult Kill() = 0;

  /**
   * Get the worker type name.
   */
  virtual std::string TypeName() const = 0;
};

}  // namespace script_runner
