#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json_fwd.hpp>

namespace script_runner {

/**
 * The script completed; value is the interpreter's string conversion
 * of the completion value.
 */
struct Success {
  std::string value;
  bool operator==(const Success&) const = default;
};

/**
 * The script failed on its own (syntax error, uncaught exception,
 * heap exhaustion).
 */
struct RuntimeError {
  std::string message;
  bool operator==(const RuntimeError&) const = default;
};

/**
 * The execution was aborted by a time limit.
 */
struct Timeout {
  bool operator==(const Timeout&) const = default;
};

/**
 * Supervision failed: the worker could not be started, its output could
 * not be parsed, or its termination could not be confirmed.
 * The message is for logs only and is never returned to the caller.
 */
struct KillError {
  std::string message;
  bool operator==(const KillError&) const = default;
};

/**
 * Final result of one request. Exactly one alternative per request.
 */
using ExecutionOutcome = std::variant<Success, RuntimeError, Timeout, KillError>;

enum class OutcomeKind : uint8_t {
  kSuccess = 0,
  kRuntimeError = 1,
  kTimeout = 2,
  kKillError = 3,
};

/**
 * Get the kind of an outcome.
 */
OutcomeKind GetOutcomeKind(const ExecutionOutcome& outcome);

/**
 * Stable lowercase name of an outcome kind ("success", "runtime_error",
 * "timeout", "kill_error"). Used on the worker wire and in traces.
 */
const char* OutcomeKindName(OutcomeKind kind);

/**
 * Format an outcome for debugging/logging.
 */
std::string FormatOutcome(const ExecutionOutcome& outcome);

/**
 * Response body returned to the caller: exactly one of result/error
 * is meaningful.
 */
struct ScriptResponse {
  std::string result;
  std::string error;

  nlohmann::json ToJson() const;
  bool operator==(const ScriptResponse&) const = default;
};

// Error marker for Timeout outcomes.
inline constexpr const char* kTimeoutMarker = "Timeout";
// Error marker for KillError outcomes and request-level failures.
inline constexpr const char* kErrorMarker = "Error";

/**
 * Map an outcome to the caller-facing response.
 */
ScriptResponse ToResponse(const ExecutionOutcome& outcome);

/**
 * Serialize an outcome as the single JSON object a worker writes to stdout:
 * {"result": ..., "error": ..., "outcome": <kind name>}.
 */
std::string SerializeWorkerResult(const ExecutionOutcome& outcome);

/**
 * Parse a worker's stdout back into an outcome.
 *
 * Malformed, truncated or empty output yields KillError. A result without
 * an "outcome" field is read as success when "error" is empty and as a
 * runtime error otherwise.
 */
ExecutionOutcome ParseWorkerResult(const std::string& output);

}  // namespace script_runner
