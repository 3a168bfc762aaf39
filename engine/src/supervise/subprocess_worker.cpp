#include "supervise/subprocess_worker.h"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

extern char** environ;

namespace script_runner {

namespace {

constexpr size_t kReadChunk = 4096;

void CloseFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// A worker dying mid-write must not take the server down with SIGPIPE.
void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

SubprocessWorker::SubprocessWorker(std::vector<std::string> argv, size_t max_output_bytes)
    : argv_(std::move(argv)), max_output_bytes_(max_output_bytes) {}

SubprocessWorker::~SubprocessWorker() {
  CloseFd(stdin_fd_);
  CloseFd(stdout_fd_);
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ > 0 && !reaped_) {
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
  }
}

std::vector<std::string> SubprocessWorker::WorkerCommand(const std::string& worker_path,
                                                         const ResourceLimits& limits) {
  return {
      worker_path,
      "--max-execution-time-ms", std::to_string(limits.max_execution_time_ms),
      "--max-heap-size-bytes", std::to_string(limits.max_heap_size_bytes),
  };
}

bool SubprocessWorker::Start(const std::string& script, std::string* error_out) {
  // Held across the spawn so a concurrent Kill() sees either no child
  // (and cancels the start) or the spawned pid.
  std::lock_guard<std::mutex> lock(mu_);
  if (cancelled_) {
    if (error_out) *error_out = "worker killed before start";
    return false;
  }
  if (pid_ > 0) {
    if (error_out) *error_out = "worker already started";
    return false;
  }
  if (argv_.empty()) {
    if (error_out) *error_out = "empty worker command";
    return false;
  }
  IgnoreSigpipeOnce();

  input_ = nlohmann::json{{"script", script}}.dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0) {
    int err = errno;
    CloseFd(in_pipe[0]);
    CloseFd(in_pipe[1]);
    if (error_out) *error_out = fmt::format("pipe failed: {}", strerror(err));
    return false;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);

  std::vector<char*> args;
  args.reserve(argv_.size() + 1);
  for (auto& arg : argv_) args.push_back(arg.data());
  args.push_back(nullptr);

  pid_t pid = -1;
  int rc = posix_spawn(&pid, argv_[0].c_str(), &actions, nullptr, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);

  CloseFd(in_pipe[0]);
  CloseFd(out_pipe[1]);
  if (rc != 0) {
    CloseFd(in_pipe[1]);
    CloseFd(out_pipe[0]);
    if (error_out) {
      *error_out = fmt::format("posix_spawn {} failed: {}", argv_[0], strerror(rc));
    }
    return false;
  }

  pid_ = pid;
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  return true;
}

void SubprocessWorker::FeedInput() {
  size_t written = 0;
  while (written < input_.size()) {
    ssize_t n = write(stdin_fd_, input_.data() + written, input_.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      break;  // EPIPE: the worker is gone, its exit status tells the rest
    }
    written += static_cast<size_t>(n);
  }
  CloseFd(stdin_fd_);
}

bool SubprocessWorker::DrainOutput(std::string* out) {
  bool truncated = false;
  char buf[kReadChunk];
  while (true) {
    ssize_t n = read(stdout_fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;
    size_t room = max_output_bytes_ > out->size() ? max_output_bytes_ - out->size() : 0;
    if (static_cast<size_t>(n) > room) {
      truncated = true;
    }
    // Keep draining past the cap so the worker never blocks on a full pipe
    out->append(buf, std::min(room, static_cast<size_t>(n)));
  }
  CloseFd(stdout_fd_);
  return !truncated;
}

int SubprocessWorker::Reap() {
  siginfo_t info{};
  while (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
    if (errno != EINTR) break;
  }
  std::lock_guard<std::mutex> lock(mu_);
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      status = -1;
      break;
    }
  }
  reaped_ = true;
  return status;
}

ExecutionOutcome SubprocessWorker::Wait() {
  if (pid_ <= 0) {
    return KillError{"worker not started"};
  }

  FeedInput();
  std::string output;
  bool complete = DrainOutput(&output);
  int status = Reap();

  if (status == -1) {
    return KillError{"could not collect worker exit status"};
  }
  if (WIFSIGNALED(status)) {
    return KillError{fmt::format("worker terminated by signal {}", WTERMSIG(status))};
  }
  if (!complete) {
    return KillError{fmt::format("worker output exceeded {} bytes", max_output_bytes_)};
  }

  ExecutionOutcome outcome = ParseWorkerResult(output);
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0 &&
      !std::holds_alternative<KillError>(outcome)) {
    return KillError{fmt::format("worker exited with status {}", WEXITSTATUS(status))};
  }
  return outcome;
}

KillResult SubprocessWorker::Kill() {
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ <= 0) {
    cancelled_ = true;
    return {KillResult::Status::kKilled, ""};
  }
  if (reaped_) {
    return {KillResult::Status::kAlreadyExited, ""};
  }
  if (kill(pid_, SIGKILL) == 0) {
    return {KillResult::Status::kKilled, ""};
  }
  return {KillResult::Status::kFailed,
          fmt::format("kill({}) failed: {}", pid_, strerror(errno))};
}

}  // namespace script_runner
