#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

#include "config/service_config.h"
#include "js/interpreter_engine.h"
#include "js/interrupt_token.h"
#include "supervise/worker.h"

namespace script_runner {

/**
 * Worker that runs the InterpreterEngine on a dedicated thread of the
 * server process.
 *
 * A thread cannot be killed, so Kill() requests an interrupt and waits up
 * to kill_grace for the VM to reach a checkpoint. If it does not, the kill
 * is reported as kFailed.
 */
class InProcessWorker : public Worker {
 public:
  InProcessWorker(const InterpreterEngine& engine,
                  const ResourceLimits& limits,
                  std::chrono::milliseconds kill_grace);
  ~InProcessWorker() override;

  InProcessWorker(const InProcessWorker&) = delete;
  InProcessWorker& operator=(const InProcessWorker&) = delete;

  bool Start(const std::string& script, std::string* error_out) override;
  ExecutionOutcome Wait() override;
  KillResult Kill() override;
  std::string TypeName() const override { return "in_process"; }

 private:
  void Run(std::string script);

  const InterpreterEngine& engine_;
  const ResourceLimits& limits_;
  std::chrono::milliseconds kill_grace_;

  InterruptToken token_;
  std::thread thread_;

  std::mutex mu_;
  std::condition_variable done_cv_;
  bool started_ = false;
  bool cancelled_ = false;
  std::optional<ExecutionOutcome> outcome_;
};

}  // namespace script_runner
