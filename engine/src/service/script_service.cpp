#include "service/script_service.h"

#include <chrono>
#include <stdexcept>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "logging/trace.h"
#include "supervise/in_process_worker.h"
#include "supervise/process_watchdog.h"
#include "supervise/subprocess_worker.h"

namespace script_runner {

ScriptService::ScriptService(ServiceConfig config) : config_(std::move(config)) {}

std::unique_ptr<Worker> ScriptService::MakeWorker() const {
  switch (config_.worker_mode) {
    case WorkerMode::kSubprocess:
      return std::make_unique<SubprocessWorker>(
          SubprocessWorker::WorkerCommand(config_.worker_path, config_.limits),
          static_cast<size_t>(config_.max_output_bytes));
    case WorkerMode::kInProcess:
      return std::make_unique<InProcessWorker>(
          engine_, config_.limits, std::chrono::milliseconds(config_.kill_grace_ms));
  }
  throw std::logic_error("unknown worker mode");
}

ExecutionOutcome ScriptService::Supervise(const std::string& script, uint64_t request_id) {
  try {
    std::unique_ptr<Worker> worker = MakeWorker();
    ProcessWatchdog watchdog(std::chrono::milliseconds(config_.EffectiveHardTimeoutMs()),
                             request_id);
    return watchdog.Supervise(*worker, script);
  } catch (const std::exception& e) {
    return KillError{fmt::format("supervision failed: {}", e.what())};
  }
}

ExecutionOutcome ScriptService::Execute(const std::string& script) {
  uint64_t request_id = next_request_id_.fetch_add(1);
  auto start = std::chrono::steady_clock::now();
  Tracer::LogRequestStart(request_id, script.size());

  ExecutionOutcome outcome = Supervise(script, request_id);

  auto end = std::chrono::steady_clock::now();
  double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
  const auto* kill_error = std::get_if<KillError>(&outcome);
  Tracer::LogRequestEnd(request_id, OutcomeKindName(GetOutcomeKind(outcome)), duration_ms,
                        kill_error ? kill_error->message : "");
  return outcome;
}

ServiceReply ScriptService::HandleScript(const std::string& script) {
  ServiceReply reply;
  reply.response = ToResponse(Execute(script));
  return reply;
}

ServiceReply ScriptService::ProtocolError(const std::string& detail) {
  Tracer::LogSupervisionEvent("protocol_error", 0, "", detail);
  ServiceReply reply;
  reply.status = 400;
  reply.response = ScriptResponse{"", kErrorMarker};
  return reply;
}

ServiceReply ScriptService::HandleJson(const std::string& body) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    return ProtocolError(fmt::format("request is not JSON: {}", e.what()));
  }

  if (!request.is_object()) {
    return ProtocolError("request must be a JSON object");
  }
  auto it = request.find("script");
  if (it == request.end()) {
    return ProtocolError("missing 'script'");
  }
  if (!it->is_string()) {
    return ProtocolError("'script' must be a string");
  }
  return HandleScript(it->get<std::string>());
}

}  // namespace script_runner
