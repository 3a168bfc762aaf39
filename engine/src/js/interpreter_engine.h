#pragma once

#include <string>

#include "config/service_config.h"
#include "js/interrupt_token.h"
#include "outcome/outcome.h"

namespace script_runner {

/**
 * InterpreterEngine runs one untrusted JavaScript snippet on QuickJS.
 *
 * Every call gets a fresh runtime and context, so nothing leaks between
 * requests. Enforces:
 * - limits.max_heap_size_bytes through the runtime allocator
 *   (exhaustion is a RuntimeError, never a host crash)
 * - limits.max_execution_time_ms through an InterruptController that
 *   aborts the VM at its next checkpoint (outcome Timeout)
 * - a bounded native stack so deep recursion raises a RangeError
 *
 * Sandbox guarantees:
 * - No QuickJS std/os modules exposed
 * - No filesystem/network/process APIs
 */
class InterpreterEngine {
 public:
  // Native stack budget for the VM.
  static constexpr size_t kMaxStackBytes = 1024 * 1024;

  InterpreterEngine() = default;

  /**
   * Evaluate a script and return its outcome.
   *
   * If external is non-null, requesting it aborts the script the same way
   * the engine's own timer does (outcome Timeout). Used by supervisors that
   * run the engine in-process.
   */
  ExecutionOutcome Execute(const std::string& script,
                           const ResourceLimits& limits,
                           InterruptToken* external = nullptr) const;
};

}  // namespace script_runner
