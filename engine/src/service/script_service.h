#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "config/service_config.h"
#include "js/interpreter_engine.h"
#include "outcome/outcome.h"
#include "supervise/worker.h"

namespace script_runner {

/**
 * HTTP-agnostic reply: status code plus the fixed-shape response body.
 */
struct ServiceReply {
  int status = 200;
  ScriptResponse response;
};

/**
 * Request boundary of the service.
 *
 * Turns a request into exactly one ExecutionOutcome under the configured
 * limits and maps it to a response. Nothing thrown below this layer
 * escapes it: every failure becomes the "Error" response.
 *
 * Safe to call from many threads; each request gets its own worker and
 * watchdog.
 */
class ScriptService {
 public:
  explicit ScriptService(ServiceConfig config);

  ScriptService(const ScriptService&) = delete;
  ScriptService& operator=(const ScriptService&) = delete;

  /**
   * Handle a JSON request body {"script": <string>}.
   * Malformed requests get status 400.
   */
  ServiceReply HandleJson(const std::string& body);

  /**
   * Run an already extracted script and map the outcome.
   */
  ServiceReply HandleScript(const std::string& script);

  /**
   * Run a script under supervision and return the raw outcome.
   */
  ExecutionOutcome Execute(const std::string& script);

  const ServiceConfig& Config() const { return config_; }

 private:
  std::unique_ptr<Worker> MakeWorker() const;
  ExecutionOutcome Supervise(const std::string& script, uint64_t request_id);
  ServiceReply ProtocolError(const std::string& detail);

  const ServiceConfig config_;
  InterpreterEngine engine_;
  std::atomic<uint64_t> next_request_id_{1};
};

}  // namespace script_runner
