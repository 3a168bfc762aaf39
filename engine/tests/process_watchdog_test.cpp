#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "js/interpreter_engine.h"
#include "logging/trace.h"
#include "supervise/in_process_worker.h"
#include "supervise/process_watchdog.h"
#include "supervise/subprocess_worker.h"

using namespace script_runner;
using namespace std::chrono_literals;

namespace {

/**
 * Scripted worker: finishes after a delay unless killed first.
 */
class FakeWorker : public Worker {
 public:
  std::chrono::milliseconds run_time{0};
  ExecutionOutcome result = Success{"done"};
  bool fail_start = false;
  int failed_kills = 0;          // Kill() reports kFailed this many times first
  bool report_exited = false;    // Kill() reports kAlreadyExited

  std::atomic<int> kill_calls{0};
  std::atomic<int> wait_calls{0};

  bool Start(const std::string&, std::string* error_out) override {
    if (fail_start) {
      if (error_out) *error_out = "no such worker";
      return false;
    }
    return true;
  }

  ExecutionOutcome Wait() override {
    wait_calls++;
    std::unique_lock<std::mutex> lock(mu_);
    if (cv_.wait_for(lock, run_time, [this] { return killed_; })) {
      return KillError{"worker terminated by signal 9"};
    }
    return result;
  }

  KillResult Kill() override {
    kill_calls++;
    if (report_exited) {
      return {KillResult::Status::kAlreadyExited, ""};
    }
    if (failed_kills > 0) {
      failed_kills--;
      return {KillResult::Status::kFailed, "kill refused"};
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      killed_ = true;
    }
    cv_.notify_all();
    return {KillResult::Status::kKilled, ""};
  }

  std::string TypeName() const override { return "fake"; }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool killed_ = false;
};

std::vector<std::string> Shell(const std::string& command) {
  return {"/bin/sh", "-c", command};
}

bool ProcessGone(pid_t pid) {
  return kill(pid, 0) == -1 && errno == ESRCH;
}

}  // namespace

TEST_CASE("ProcessWatchdog races completion against the hard timer", "[watchdog]") {
  Tracer::SetEnabled(false);

  SECTION("Completion before the deadline") {
    FakeWorker worker;
    worker.run_time = 10ms;
    worker.result = Success{"42"};
    ProcessWatchdog watchdog(1000ms);
    REQUIRE(watchdog.Supervise(worker, "42") == ExecutionOutcome{Success{"42"}});
    REQUIRE(watchdog.State() == RequestState::kResolved);
    REQUIRE(worker.kill_calls == 0);
  }

  SECTION("Worker-reported outcomes pass through") {
    FakeWorker worker;
    worker.result = RuntimeError{"Uncaught Error: x"};
    ProcessWatchdog watchdog(1000ms);
    REQUIRE(watchdog.Supervise(worker, "") == ExecutionOutcome{RuntimeError{"Uncaught Error: x"}});
  }

  SECTION("Hung worker is killed") {
    FakeWorker worker;
    worker.run_time = 60s;
    ProcessWatchdog watchdog(50ms);
    auto start = std::chrono::steady_clock::now();
    auto outcome = watchdog.Supervise(worker, "while(true){}");
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(outcome == ExecutionOutcome{Timeout{}});
    REQUIRE(elapsed < 5s);
    REQUIRE(worker.kill_calls == 1);
    REQUIRE(watchdog.State() == RequestState::kResolved);
  }

  SECTION("Unconfirmed kill is a KillError and is retried") {
    FakeWorker worker;
    worker.run_time = 60s;
    worker.failed_kills = 1;
    ProcessWatchdog watchdog(50ms);
    auto outcome = watchdog.Supervise(worker, "");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE(std::get<KillError>(outcome).message == "kill refused");
    REQUIRE(worker.kill_calls == 2);
  }

  SECTION("Worker exiting at the deadline completes normally") {
    FakeWorker worker;
    worker.run_time = 150ms;
    worker.report_exited = true;
    worker.result = Success{"late"};
    ProcessWatchdog watchdog(20ms);
    REQUIRE(watchdog.Supervise(worker, "") == ExecutionOutcome{Success{"late"}});
  }

  SECTION("Start failure") {
    FakeWorker worker;
    worker.fail_start = true;
    ProcessWatchdog watchdog(1000ms);
    auto outcome = watchdog.Supervise(worker, "");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE_THAT(std::get<KillError>(outcome).message,
                 Catch::Matchers::ContainsSubstring("no such worker"));
    REQUIRE(worker.wait_calls == 0);
    REQUIRE(watchdog.State() == RequestState::kResolved);
  }

  SECTION("Near-simultaneous completion and expiry resolve exactly once") {
    for (int round = 0; round < 50; ++round) {
      FakeWorker worker;
      worker.run_time = 5ms;
      ProcessWatchdog watchdog(5ms);
      auto outcome = watchdog.Supervise(worker, "");
      bool expected = outcome == ExecutionOutcome{Success{"done"}} ||
                      outcome == ExecutionOutcome{Timeout{}};
      REQUIRE(expected);
      REQUIRE(watchdog.State() == RequestState::kResolved);
    }
  }
}

TEST_CASE("ProcessWatchdog with subprocess stand-ins", "[watchdog][subprocess]") {
  Tracer::SetEnabled(false);
  constexpr size_t kMaxOutput = 1024 * 1024;

  SECTION("Well-formed result") {
    SubprocessWorker worker(
        Shell(R"(cat >/dev/null; printf '{"result":"7","error":""}\n')"), kMaxOutput);
    ProcessWatchdog watchdog(2000ms);
    REQUIRE(watchdog.Supervise(worker, "") == ExecutionOutcome{Success{"7"}});
  }

  SECTION("Hung worker is killed and reaped") {
    SubprocessWorker worker(Shell("exec sleep 30"), kMaxOutput);
    ProcessWatchdog watchdog(100ms);
    auto start = std::chrono::steady_clock::now();
    auto outcome = watchdog.Supervise(worker, "");
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(outcome == ExecutionOutcome{Timeout{}});
    REQUIRE(elapsed < 5s);
    REQUIRE(ProcessGone(worker.Pid()));
  }

  SECTION("Garbage output") {
    SubprocessWorker worker(Shell("cat >/dev/null; echo garbage"), kMaxOutput);
    ProcessWatchdog watchdog(2000ms);
    REQUIRE(std::holds_alternative<KillError>(watchdog.Supervise(worker, "")));
  }

  SECTION("No output") {
    SubprocessWorker worker(Shell("cat >/dev/null"), kMaxOutput);
    ProcessWatchdog watchdog(2000ms);
    REQUIRE(std::holds_alternative<KillError>(watchdog.Supervise(worker, "")));
  }

  SECTION("Abnormal exit") {
    SubprocessWorker worker(
        Shell(R"(cat >/dev/null; printf '{"result":"7","error":""}'; exit 3)"), kMaxOutput);
    ProcessWatchdog watchdog(2000ms);
    auto outcome = watchdog.Supervise(worker, "");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE_THAT(std::get<KillError>(outcome).message, Catch::Matchers::ContainsSubstring("3"));
  }

  SECTION("Oversized output") {
    SubprocessWorker worker(Shell("cat >/dev/null; head -c 100000 /dev/zero"), 1024);
    ProcessWatchdog watchdog(2000ms);
    auto outcome = watchdog.Supervise(worker, "");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE_THAT(std::get<KillError>(outcome).message,
                 Catch::Matchers::ContainsSubstring("exceeded"));
  }

  SECTION("Worker that never reads its input") {
    SubprocessWorker worker(
        Shell(R"(printf '{"result":"x","error":""}')"), kMaxOutput);
    ProcessWatchdog watchdog(2000ms);
    REQUIRE(watchdog.Supervise(worker, std::string(1 << 20, 'a')) ==
            ExecutionOutcome{Success{"x"}});
  }

  SECTION("Missing executable") {
    SubprocessWorker worker({"/nonexistent/script_worker"}, kMaxOutput);
    ProcessWatchdog watchdog(2000ms);
    REQUIRE(std::holds_alternative<KillError>(watchdog.Supervise(worker, "1+1")));
  }
}

TEST_CASE("ProcessWatchdog with the script_worker executable", "[watchdog][subprocess][worker]") {
  Tracer::SetEnabled(false);
  ResourceLimits limits;

  SECTION("Success") {
    SubprocessWorker worker(SubprocessWorker::WorkerCommand(SCRIPT_WORKER_PATH, limits), 1 << 20);
    ProcessWatchdog watchdog(5000ms);
    REQUIRE(watchdog.Supervise(worker, "1+1") == ExecutionOutcome{Success{"2"}});
  }

  SECTION("Syntax error") {
    SubprocessWorker worker(SubprocessWorker::WorkerCommand(SCRIPT_WORKER_PATH, limits), 1 << 20);
    ProcessWatchdog watchdog(5000ms);
    auto outcome = watchdog.Supervise(worker, "not valid js((");
    REQUIRE(std::holds_alternative<RuntimeError>(outcome));
    REQUIRE_THAT(std::get<RuntimeError>(outcome).message,
                 Catch::Matchers::StartsWith("Uncaught SyntaxError"));
  }

  SECTION("Interpreter timeout reported by the worker") {
    limits.max_execution_time_ms = 100;
    SubprocessWorker worker(SubprocessWorker::WorkerCommand(SCRIPT_WORKER_PATH, limits), 1 << 20);
    ProcessWatchdog watchdog(5000ms);
    REQUIRE(watchdog.Supervise(worker, "while(true){}") == ExecutionOutcome{Timeout{}});
  }

  SECTION("Out-of-range limits are rejected by the worker") {
    std::string bad_value = GENERATE("-1", "18446744073709551615", "0", "12ms");
    std::vector<std::string> argv = {SCRIPT_WORKER_PATH, "--max-execution-time-ms", bad_value};
    SubprocessWorker worker(argv, 1 << 20);
    ProcessWatchdog watchdog(5000ms);
    auto outcome = watchdog.Supervise(worker, "1+1");
    REQUIRE(std::holds_alternative<KillError>(outcome));
  }

  SECTION("Hard timeout kills the worker") {
    limits.max_execution_time_ms = 60000;
    SubprocessWorker worker(SubprocessWorker::WorkerCommand(SCRIPT_WORKER_PATH, limits), 1 << 20);
    ProcessWatchdog watchdog(200ms);
    auto start = std::chrono::steady_clock::now();
    REQUIRE(watchdog.Supervise(worker, "while(true){}") == ExecutionOutcome{Timeout{}});
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE(ProcessGone(worker.Pid()));
  }
}

TEST_CASE("ProcessWatchdog with an in-process worker", "[watchdog][in_process]") {
  Tracer::SetEnabled(false);
  InterpreterEngine engine;
  ResourceLimits limits;

  SECTION("Success") {
    InProcessWorker worker(engine, limits, 100ms);
    ProcessWatchdog watchdog(5000ms);
    REQUIRE(watchdog.Supervise(worker, "6*7") == ExecutionOutcome{Success{"42"}});
  }

  SECTION("Hard timeout interrupts the interpreter") {
    limits.max_execution_time_ms = 60000;
    InProcessWorker worker(engine, limits, 1000ms);
    ProcessWatchdog watchdog(100ms);
    auto start = std::chrono::steady_clock::now();
    REQUIRE(watchdog.Supervise(worker, "while(true){}") == ExecutionOutcome{Timeout{}});
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
  }

  SECTION("Kill before start cancels the worker") {
    InProcessWorker worker(engine, limits, 100ms);
    REQUIRE(worker.Kill().status == KillResult::Status::kKilled);
    std::string error;
    REQUIRE_FALSE(worker.Start("1+1", &error));
    REQUIRE_THAT(error, Catch::Matchers::ContainsSubstring("killed before start"));
  }

  SECTION("Kill after completion") {
    InProcessWorker worker(engine, limits, 100ms);
    std::string error;
    REQUIRE(worker.Start("1+1", &error));
    REQUIRE(worker.Wait() == ExecutionOutcome{Success{"2"}});
    REQUIRE(worker.Kill().status == KillResult::Status::kAlreadyExited);
  }
}
