#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace script_runner {

/**
 * Tracer - structured logging for request handling and supervision.
 *
 * Every event is one JSON object per line on stdout.
 */
class Tracer {
 public:
  /**
   * Log request start.
   */
  static void LogRequestStart(uint64_t request_id, size_t script_bytes);

  /**
   * Log request end.
   * @param outcome Outcome kind name (success, runtime_error, timeout, kill_error)
   * @param detail Internal diagnostic, never sent to the caller (empty = not set)
   */
  static void LogRequestEnd(uint64_t request_id,
                            const std::string& outcome,
                            double duration_ms,
                            const std::string& detail = "");

  /**
   * Log a supervision event (worker_spawn_failed, kill_failed,
   * malformed_worker_output, protocol_error).
   * @param worker_type Worker type name (empty = not set)
   */
  static void LogSupervisionEvent(const std::string& event,
                                  uint64_t request_id,
                                  const std::string& worker_type,
                                  const std::string& detail);

  /**
   * Log server start with the effective configuration.
   */
  static void LogServerStart(const std::string& host,
                             int port,
                             const std::string& worker_mode,
                             uint64_t max_execution_time_ms,
                             uint64_t max_heap_size_bytes,
                             uint64_t hard_timeout_ms);

  /**
   * Enable/disable tracing output.
   */
  static void SetEnabled(bool enabled);

  /**
   * Check if tracing is enabled.
   */
  static bool IsEnabled();
};

}  // namespace script_runner
