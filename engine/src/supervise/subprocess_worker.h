#pragma once

#include <sys/types.h>

#include <mutex>
#include <string>
#include <vector>

#include "config/service_config.h"
#include "supervise/worker.h"

namespace script_runner {

/**
 * Worker backed by a child process speaking the worker protocol:
 * {"script": ...} on stdin, one JSON result object on stdout.
 *
 * The child is spawned with posix_spawn and close-on-exec pipes.
 * Kill() sends SIGKILL. Exit is observed with waitid(WNOWAIT) first and
 * the pid is reaped under the same lock Kill() takes, so a reaped
 * (possibly reused) pid is never signalled.
 */
class SubprocessWorker : public Worker {
 public:
  SubprocessWorker(std::vector<std::string> argv, size_t max_output_bytes);
  ~SubprocessWorker() override;

  SubprocessWorker(const SubprocessWorker&) = delete;
  SubprocessWorker& operator=(const SubprocessWorker&) = delete;

  /**
   * Command line for the script_worker executable with the given limits.
   */
  static std::vector<std::string> WorkerCommand(const std::string& worker_path,
                                                const ResourceLimits& limits);

  bool Start(const std::string& script, std::string* error_out) override;
  ExecutionOutcome Wait() override;
  KillResult Kill() override;
  std::string TypeName() const override { return "subprocess"; }

  pid_t Pid() const { return pid_; }

 private:
  void FeedInput();
  bool DrainOutput(std::string* out);
  int Reap();

  std::vector<std::string> argv_;
  size_t max_output_bytes_;
  std::string input_;

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;

  std::mutex mu_;  // guards pid_ publication, reaped_ and cancelled_
  bool reaped_ = false;
  bool cancelled_ = false;  // Kill() arrived before Start()
};

}  // namespace script_runner
