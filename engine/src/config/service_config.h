#pragma once

#include <cstdint>
#include <string>

namespace script_runner {

/**
 * Interpreter-level limits applied to every script.
 * Both values must be non-zero.
 */
struct ResourceLimits {
  uint64_t max_execution_time_ms = 300;
  uint64_t max_heap_size_bytes = 64ull * 1024 * 1024;  // 64 MiB
};

// Upper bound for every millisecond setting (24 h); keeps deadlines far
// from the range of std::chrono::milliseconds.
inline constexpr uint64_t kMaxTimeoutMs = 24ull * 60 * 60 * 1000;

/**
 * Parse an unsigned decimal number (digits only, no sign).
 * Returns false on garbage or overflow.
 */
bool ParseUnsigned(const std::string& text, uint64_t& out);

/**
 * How a script is isolated from the server process.
 */
enum class WorkerMode {
  kSubprocess,  // script_worker executable, killed with SIGKILL
  kInProcess    // interpreter on a dedicated thread, stopped via interrupt
};

/**
 * Parse a worker mode name ("subprocess" or "in_process").
 * Returns false if the name is unknown.
 */
bool ParseWorkerMode(const std::string& name, WorkerMode& out);

/**
 * Name of a worker mode, for logging.
 */
const char* WorkerModeName(WorkerMode mode);

/**
 * Process-wide service configuration.
 *
 * Built once at startup (defaults, then config file, then environment,
 * then command line) and shared read-only by every request afterwards.
 */
struct ServiceConfig {
  ResourceLimits limits;

  // Process-level deadline enforced by the watchdog.
  // 0 = same as limits.max_execution_time_ms; otherwise must not be smaller.
  uint64_t hard_timeout_ms = 0;

  // How long Kill() waits for an in-process worker to reach a checkpoint.
  uint64_t kill_grace_ms = 100;

  WorkerMode worker_mode = WorkerMode::kSubprocess;
  std::string worker_path;  // empty = script_worker beside the server binary

  // Captured worker output beyond this is treated as malformed.
  uint64_t max_output_bytes = 1024 * 1024;

  std::string host = "0.0.0.0";
  int port = 7690;

  bool trace_enabled = true;

  /**
   * Default configuration.
   */
  static ServiceConfig Default();

  /**
   * Overlay values from a JSON document.
   * Keys that are absent keep their current value.
   */
  bool LoadFromJson(const std::string& json_str, std::string* error_out = nullptr);

  /**
   * Overlay values from a JSON file.
   */
  bool LoadFromFile(const std::string& path, std::string* error_out = nullptr);

  /**
   * Overlay values from environment variables:
   * PORT, MAX_EXECUTION_TIME_MS, MAX_HEAP_SIZE_BYTES, HARD_TIMEOUT_MS,
   * WORKER_MODE, WORKER_PATH.
   */
  bool ApplyEnvironment(std::string* error_out = nullptr);

  /**
   * Hard timeout actually used by the watchdog.
   */
  uint64_t EffectiveHardTimeoutMs() const {
    return hard_timeout_ms == 0 ? limits.max_execution_time_ms : hard_timeout_ms;
  }

  /**
   * Check cross-field constraints.
   */
  bool Validate(std::string* error_out = nullptr) const;
};

}  // namespace script_runner
