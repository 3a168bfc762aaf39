#include "logging/trace.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include <nlohmann/json.hpp>

namespace script_runner {

namespace {

std::atomic<bool> g_enabled{true};
std::mutex g_output_mu;

void Emit(const nlohmann::json& log) {
  // Requests are traced from many threads; keep lines whole.
  std::string line = log.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(g_output_mu);
  std::cout << line << std::endl;
}

}  // namespace

void Tracer::LogRequestStart(uint64_t request_id, size_t script_bytes) {
  if (!IsEnabled()) return;

  nlohmann::json log;
  log["event"] = "request_start";
  log["request_id"] = request_id;
  log["script_bytes"] = script_bytes;
  Emit(log);
}

void Tracer::LogRequestEnd(uint64_t request_id,
                           const std::string& outcome,
                           double duration_ms,
                           const std::string& detail) {
  if (!IsEnabled()) return;

  nlohmann::json log;
  log["event"] = "request_end";
  log["request_id"] = request_id;
  log["outcome"] = outcome;
  log["duration_ms"] = duration_ms;

  if (!detail.empty()) {
    log["detail"] = detail;
  }

  Emit(log);
}

void Tracer::LogSupervisionEvent(const std::string& event,
                                 uint64_t request_id,
                                 const std::string& worker_type,
                                 const std::string& detail) {
  if (!IsEnabled()) return;

  nlohmann::json log;
  log["event"] = event;
  log["request_id"] = request_id;

  if (!worker_type.empty()) {
    log["worker"] = worker_type;
  }
  log["detail"] = detail;

  Emit(log);
}

void Tracer::LogServerStart(const std::string& host,
                            int port,
                            const std::string& worker_mode,
                            uint64_t max_execution_time_ms,
                            uint64_t max_heap_size_bytes,
                            uint64_t hard_timeout_ms) {
  if (!IsEnabled()) return;

  nlohmann::json log;
  log["event"] = "server_start";
  log["host"] = host;
  log["port"] = port;
  log["worker_mode"] = worker_mode;
  log["max_execution_time_ms"] = max_execution_time_ms;
  log["max_heap_size_bytes"] = max_heap_size_bytes;
  log["hard_timeout_ms"] = hard_timeout_ms;
  Emit(log);
}

void Tracer::SetEnabled(bool enabled) {
  g_enabled.store(enabled);
}

bool Tracer::IsEnabled() {
  return g_enabled.load();
}

}  // namespace script_runner
