#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "config/service_config.h"
#include "js/interpreter_engine.h"
#include "logging/trace.h"
#include "outcome/outcome.h"

using namespace script_runner;

/**
 * script_worker - runs one script and reports its outcome.
 *
 * stdin:  {"script": <string>}
 * stdout: one JSON result object, see SerializeWorkerResult()
 *
 * Exit status 0 when a result was produced, 2 when the input or the
 * command line was invalid (a kill_error result is still written).
 */

namespace {

constexpr int kInvalidInputExit = 2;

int Fail(const std::string& detail) {
  std::cout << SerializeWorkerResult(KillError{detail}) << std::endl;
  return kInvalidInputExit;
}

bool ParseLimit(const std::string& text, uint64_t max, uint64_t& out) {
  uint64_t value = 0;
  if (!ParseUnsigned(text, value) || value == 0 || value > max) return false;
  out = value;
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  // stdout is the result channel.
  Tracer::SetEnabled(false);

  ResourceLimits limits;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--max-execution-time-ms" && i + 1 < argc) {
      if (!ParseLimit(argv[++i], kMaxTimeoutMs, limits.max_execution_time_ms)) {
        return Fail(fmt::format("invalid {} '{}'", arg, argv[i]));
      }
    } else if (arg == "--max-heap-size-bytes" && i + 1 < argc) {
      if (!ParseLimit(argv[++i], UINT64_MAX, limits.max_heap_size_bytes)) {
        return Fail(fmt::format("invalid {} '{}'", arg, argv[i]));
      }
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      return Fail(fmt::format("unknown option '{}'", arg));
    }
  }

  std::string input((std::istreambuf_iterator<char>(std::cin)),
                    std::istreambuf_iterator<char>());

  std::string script;
  try {
    nlohmann::json request = nlohmann::json::parse(input);
    if (!request.is_object() || !request.contains("script") || !request["script"].is_string()) {
      return Fail("input must be {\"script\": <string>}");
    }
    script = request["script"].get<std::string>();
  } catch (const nlohmann::json::parse_error& e) {
    return Fail(fmt::format("input is not JSON: {}", e.what()));
  }

  InterpreterEngine engine;
  ExecutionOutcome outcome;
  try {
    outcome = engine.Execute(script, limits);
  } catch (const std::exception& e) {
    outcome = KillError{fmt::format("interpreter failed: {}", e.what())};
  }
  std::cout << SerializeWorkerResult(outcome) << std::endl;
  return 0;
}
