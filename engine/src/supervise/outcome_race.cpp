#include "supervise/outcome_race.h"

namespace script_runner {

const char* RaceSignalName(RaceSignal signal) {
  switch (signal) {
    case RaceSignal::kCompleted:
      return "completed";
    case RaceSignal::kTimedOut:
      return "timed_out";
    case RaceSignal::kKillFailed:
      return "kill_failed";
  }
  return "unknown";
}

bool OutcomeRace::TryResolve(RaceSignal signal, std::string detail) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (resolution_) {
      return false;
    }
    resolution_ = Resolution{signal, std::move(detail)};
  }
  cv_.notify_all();
  return true;
}

OutcomeRace::Resolution OutcomeRace::Wait() const {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return resolution_.has_value(); });
  return *resolution_;
}

std::optional<OutcomeRace::Resolution> OutcomeRace::WaitFor(
    std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mu_);
  if (!cv_.wait_for(lock, timeout, [this] { return resolution_.has_value(); })) {
    return std::nullopt;
  }
  return resolution_;
}

bool OutcomeRace::IsResolved() const {
  std::lock_guard<std::mutex> lock(mu_);
  return resolution_.has_value();
}

const char* RequestStateName(RequestState state) {
  switch (state) {
    case RequestState::kPending:
      return "pending";
    case RequestState::kRunning:
      return "running";
    case RequestState::kCompleted:
      return "completed";
    case RequestState::kTimedOut:
      return "timed_out";
    case RequestState::kKilled:
      return "killed";
    case RequestState::kResolved:
      return "resolved";
  }
  return "unknown";
}

bool RequestLifecycle::Advance(RequestState next) {
  std::lock_guard<std::mutex> lock(mu_);
  bool allowed = false;
  switch (state_) {
    case RequestState::kPending:
      allowed = next == RequestState::kRunning;
      break;
    case RequestState::kRunning:
      allowed = next == RequestState::kCompleted ||
                next == RequestState::kTimedOut ||
                next == RequestState::kKilled;
      break;
    case RequestState::kCompleted:
    case RequestState::kTimedOut:
    case RequestState::kKilled:
      allowed = next == RequestState::kResolved;
      break;
    case RequestState::kResolved:
      allowed = false;
      break;
  }
  if (allowed) {
    state_ = next;
  }
  return allowed;
}

RequestState RequestLifecycle::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

RequestState RequestLifecycle::StateFor(RaceSignal signal) {
  switch (signal) {
    case RaceSignal::kCompleted:
      return RequestState::kCompleted;
    case RaceSignal::kTimedOut:
      return RequestState::kTimedOut;
    case RaceSignal::kKillFailed:
      return RequestState::kKilled;
  }
  return RequestState::kKilled;
}

}  // namespace script_runner
