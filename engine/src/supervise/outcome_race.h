#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace script_runner {

/**
 * Competing signals that can end a supervised execution.
 */
enum class RaceSignal : uint8_t {
  kCompleted,   // worker finished on its own (output read, process reaped)
  kTimedOut,    // hard timer expired and the worker was killed
  kKillFailed,  // termination was needed but could not be confirmed
};

const char* RaceSignalName(RaceSignal signal);

/**
 * Single-write-wins cell used to race worker completion against the
 * hard timer.
 *
 * The first TryResolve() decides the winner; later writers return false
 * immediately and their signal is dropped. Readers block only on this
 * cell, never on the worker or the timer directly.
 */
class OutcomeRace {
 public:
  struct Resolution {
    RaceSignal signal;
    std::string detail;
  };

  OutcomeRace() = default;
  OutcomeRace(const OutcomeRace&) = delete;
  OutcomeRace& operator=(const OutcomeRace&) = delete;

  /**
   * Offer a signal. Returns true if this call won the race.
   */
  bool TryResolve(RaceSignal signal, std::string detail = "");

  /**
   * Block until resolved.
   */
  Resolution Wait() const;

  /**
   * Block until resolved or the timeout elapses (nullopt on timeout).
   */
  std::optional<Resolution> WaitFor(std::chrono::milliseconds timeout) const;

  bool IsResolved() const;

 private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::optional<Resolution> resolution_;
};

/**
 * Per-request lifecycle:
 *   Pending -> Running -> {Completed | TimedOut | Killed} -> Resolved
 *
 * Any other transition is rejected; the lifecycle is single-shot.
 */
enum class RequestState : uint8_t {
  kPending,
  kRunning,
  kCompleted,
  kTimedOut,
  kKilled,
  kResolved,
};

const char* RequestStateName(RequestState state);

class RequestLifecycle {
 public:
  RequestLifecycle() = default;

  /**
   * Move to the next state. Returns false (and leaves the state unchanged)
   * if the transition is not allowed.
   */
  bool Advance(RequestState next);

  RequestState State() const;

  /**
   * Terminal state reached by a race signal.
   */
  static RequestState StateFor(RaceSignal signal);

 private:
  mutable std::mutex mu_;
  RequestState state_ = RequestState::kPending;
};

}  // namespace script_runner
