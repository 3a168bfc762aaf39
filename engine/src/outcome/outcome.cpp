#include "outcome/outcome.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace script_runner {

OutcomeKind GetOutcomeKind(const ExecutionOutcome& outcome) {
  return std::visit(
      [](auto&& arg) -> OutcomeKind {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Success>) {
          return OutcomeKind::kSuccess;
        } else if constexpr (std::is_same_v<T, RuntimeError>) {
          return OutcomeKind::kRuntimeError;
        } else if constexpr (std::is_same_v<T, Timeout>) {
          return OutcomeKind::kTimeout;
        } else if constexpr (std::is_same_v<T, KillError>) {
          return OutcomeKind::kKillError;
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in ExecutionOutcome variant");
        }
      },
      outcome);
}

const char* OutcomeKindName(OutcomeKind kind) {
  switch (kind) {
    case OutcomeKind::kSuccess:
      return "success";
    case OutcomeKind::kRuntimeError:
      return "runtime_error";
    case OutcomeKind::kTimeout:
      return "timeout";
    case OutcomeKind::kKillError:
      return "kill_error";
  }
  return "unknown";
}

std::string FormatOutcome(const ExecutionOutcome& outcome) {
  return std::visit(
      [](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Success>) {
          return fmt::format("Success(\"{}\")", arg.value);
        } else if constexpr (std::is_same_v<T, RuntimeError>) {
          return fmt::format("RuntimeError(\"{}\")", arg.message);
        } else if constexpr (std::is_same_v<T, Timeout>) {
          return "Timeout";
        } else if constexpr (std::is_same_v<T, KillError>) {
          return fmt::format("KillError(\"{}\")", arg.message);
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in ExecutionOutcome variant");
        }
      },
      outcome);
}

nlohmann::json ScriptResponse::ToJson() const {
  return {{"result", result}, {"error", error}};
}

ScriptResponse ToResponse(const ExecutionOutcome& outcome) {
  return std::visit(
      [](auto&& arg) -> ScriptResponse {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, Success>) {
          return {arg.value, ""};
        } else if constexpr (std::is_same_v<T, RuntimeError>) {
          return {"", arg.message};
        } else if constexpr (std::is_same_v<T, Timeout>) {
          return {"", kTimeoutMarker};
        } else if constexpr (std::is_same_v<T, KillError>) {
          // Supervision details stay in the logs.
          return {"", kErrorMarker};
        } else {
          static_assert(sizeof(T) == 0, "Unknown type in ExecutionOutcome variant");
        }
      },
      outcome);
}

std::string SerializeWorkerResult(const ExecutionOutcome& outcome) {
  ScriptResponse response = ToResponse(outcome);
  nlohmann::json j = response.ToJson();
  j["outcome"] = OutcomeKindName(GetOutcomeKind(outcome));
  if (const auto* kill = std::get_if<KillError>(&outcome)) {
    j["detail"] = kill->message;
  }
  // Scripts may produce invalid UTF-8; replace rather than throw.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ExecutionOutcome ParseWorkerResult(const std::string& output) {
  if (output.empty()) {
    return KillError{"worker produced no output"};
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(output);
  } catch (const std::exception& e) {
    return KillError{std::string("malformed worker output: ") + e.what()};
  }

  if (!j.is_object()) {
    return KillError{"malformed worker output: not an object"};
  }
  auto result_it = j.find("result");
  auto error_it = j.find("error");
  if (result_it == j.end() || error_it == j.end() ||
      !result_it->is_string() || !error_it->is_string()) {
    return KillError{"malformed worker output: missing result/error"};
  }
  std::string result = result_it->get<std::string>();
  std::string error = error_it->get<std::string>();

  auto outcome_it = j.find("outcome");
  if (outcome_it == j.end()) {
    if (error.empty()) {
      return Success{std::move(result)};
    }
    return RuntimeError{std::move(error)};
  }
  if (!outcome_it->is_string()) {
    return KillError{"malformed worker output: outcome is not a string"};
  }

  std::string kind = outcome_it->get<std::string>();
  if (kind == OutcomeKindName(OutcomeKind::kSuccess)) {
    return Success{std::move(result)};
  }
  if (kind == OutcomeKindName(OutcomeKind::kRuntimeError)) {
    return RuntimeError{std::move(error)};
  }
  if (kind == OutcomeKindName(OutcomeKind::kTimeout)) {
    return Timeout{};
  }
  if (kind == OutcomeKindName(OutcomeKind::kKillError)) {
    return KillError{"worker reported: " + j.value("detail", error)};
  }
  return KillError{"malformed worker output: unknown outcome '" + kind + "'"};
}

}  // namespace script_runner
