#include "supervise/process_watchdog.h"

#include <mutex>
#include <optional>
#include <thread>

#include <fmt/format.h>

#include "logging/trace.h"

namespace script_runner {

namespace {

/**
 * Joins a thread when the enclosing scope exits.
 */
class ScopedJoin {
 public:
  explicit ScopedJoin(std::thread& thread) : thread_(thread) {}
  ~ScopedJoin() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ScopedJoin(const ScopedJoin&) = delete;
  ScopedJoin& operator=(const ScopedJoin&) = delete;

 private:
  std::thread& thread_;
};

}  // namespace

ProcessWatchdog::ProcessWatchdog(std::chrono::milliseconds hard_timeout,
                                 uint64_t request_id)
    : hard_timeout_(hard_timeout), request_id_(request_id) {}

ExecutionOutcome ProcessWatchdog::Supervise(Worker& worker, const std::string& script) {
  OutcomeRace race;
  const std::string worker_type = worker.TypeName();

  // Result of the timer's termination request, read after it is joined.
  std::optional<KillResult> timer_kill;

  // Held by the timer across Kill() and its resolution, so the completion
  // caused by a successful kill cannot resolve ahead of kTimedOut.
  std::mutex kill_mu;

  std::thread timer([&] {
    if (race.WaitFor(hard_timeout_)) {
      return;  // resolved before the deadline
    }
    std::lock_guard<std::mutex> lock(kill_mu);
    KillResult result = worker.Kill();
    switch (result.status) {
      case KillResult::Status::kKilled:
        race.TryResolve(RaceSignal::kTimedOut);
        break;
      case KillResult::Status::kAlreadyExited:
        // The completion thread is about to resolve.
        break;
      case KillResult::Status::kFailed:
        race.TryResolve(RaceSignal::kKillFailed, result.detail);
        break;
    }
    timer_kill = std::move(result);
  });

  std::thread completion;
  std::optional<ExecutionOutcome> completed;

  // Joined in reverse order on every exit path: completion, then timer.
  ScopedJoin join_timer(timer);
  ScopedJoin join_completion(completion);

  std::string start_error;
  if (!worker.Start(script, &start_error)) {
    Tracer::LogSupervisionEvent("worker_spawn_failed", request_id_, worker_type, start_error);
    race.TryResolve(RaceSignal::kKillFailed, start_error);
    // The timer may have cancelled the start first; that is a timeout like any other.
    OutcomeRace::Resolution resolution = race.Wait();
    lifecycle_.Advance(RequestState::kRunning);
    lifecycle_.Advance(RequestLifecycle::StateFor(resolution.signal));
    lifecycle_.Advance(RequestState::kResolved);
    if (resolution.signal == RaceSignal::kTimedOut) {
      return Timeout{};
    }
    return KillError{fmt::format("worker start failed: {}", start_error)};
  }
  lifecycle_.Advance(RequestState::kRunning);

  completion = std::thread([&] {
    ExecutionOutcome outcome = worker.Wait();
    completed = std::move(outcome);
    std::lock_guard<std::mutex> lock(kill_mu);
    race.TryResolve(RaceSignal::kCompleted);
  });

  OutcomeRace::Resolution resolution = race.Wait();
  lifecycle_.Advance(RequestLifecycle::StateFor(resolution.signal));

  if (resolution.signal != RaceSignal::kCompleted) {
    // The timer resolved, so it has finished its Kill() attempt. Retry once
    // if termination was not confirmed, then wait for the worker to be reaped.
    if (timer.joinable()) timer.join();
    if (timer_kill && timer_kill->status == KillResult::Status::kFailed) {
      Tracer::LogSupervisionEvent("kill_failed", request_id_, worker_type, timer_kill->detail);
      KillResult retry = worker.Kill();
      if (retry.status == KillResult::Status::kFailed) {
        Tracer::LogSupervisionEvent("kill_failed", request_id_, worker_type, retry.detail);
      }
    }
  }
  if (completion.joinable()) completion.join();
  if (timer.joinable()) timer.join();
  lifecycle_.Advance(RequestState::kResolved);

  switch (resolution.signal) {
    case RaceSignal::kCompleted:
      if (const auto* error = std::get_if<KillError>(&*completed)) {
        Tracer::LogSupervisionEvent("malformed_worker_output", request_id_, worker_type,
                                    error->message);
      }
      return *completed;
    case RaceSignal::kTimedOut:
      return Timeout{};
    case RaceSignal::kKillFailed:
      return KillError{resolution.detail};
  }
  return KillError{"unknown race signal"};
}

}  // namespace script_runner
