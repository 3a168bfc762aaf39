#include "supervise/in_process_worker.h"

#include <system_error>

#include <fmt/format.h>

namespace script_runner {

InProcessWorker::InProcessWorker(const InterpreterEngine& engine,
                                 const ResourceLimits& limits,
                                 std::chrono::milliseconds kill_grace)
    : engine_(engine), limits_(limits), kill_grace_(kill_grace) {}

InProcessWorker::~InProcessWorker() {
  token_.Request();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool InProcessWorker::Start(const std::string& script, std::string* error_out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (cancelled_) {
    if (error_out) *error_out = "worker killed before start";
    return false;
  }
  if (started_) {
    if (error_out) *error_out = "worker already started";
    return false;
  }
  try {
    thread_ = std::thread(&InProcessWorker::Run, this, script);
  } catch (const std::system_error& e) {
    if (error_out) *error_out = fmt::format("failed to start worker thread: {}", e.what());
    return false;
  }
  started_ = true;
  return true;
}

void InProcessWorker::Run(std::string script) {
  ExecutionOutcome outcome;
  try {
    outcome = engine_.Execute(script, limits_, &token_);
  } catch (const std::exception& e) {
    outcome = KillError{fmt::format("interpreter failed: {}", e.what())};
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    outcome_ = std::move(outcome);
  }
  done_cv_.notify_all();
}

ExecutionOutcome InProcessWorker::Wait() {
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (!started_) {
      return KillError{"worker not started"};
    }
    done_cv_.wait(lock, [this] { return outcome_.has_value(); });
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  return *outcome_;
}

KillResult InProcessWorker::Kill() {
  std::unique_lock<std::mutex> lock(mu_);
  if (!started_) {
    cancelled_ = true;
    return {KillResult::Status::kKilled, ""};
  }
  if (outcome_) {
    return {KillResult::Status::kAlreadyExited, ""};
  }
  token_.Request();
  if (done_cv_.wait_for(lock, kill_grace_, [this] { return outcome_.has_value(); })) {
    return {KillResult::Status::kKilled, ""};
  }
  return {KillResult::Status::kFailed,
          fmt::format("interpreter did not reach a checkpoint within {} ms",
                      kill_grace_.count())};
}

}  // namespace script_runner
