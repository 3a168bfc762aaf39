#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <nlohmann/json.hpp>

#include "outcome/outcome.h"

using namespace script_runner;
using json = nlohmann::json;

TEST_CASE("Outcome to response mapping", "[outcome]") {
  SECTION("Success") {
    REQUIRE(ToResponse(Success{"2"}) == ScriptResponse{"2", ""});
  }

  SECTION("RuntimeError carries the message") {
    REQUIRE(ToResponse(RuntimeError{"Uncaught Error: boom"}) ==
            ScriptResponse{"", "Uncaught Error: boom"});
  }

  SECTION("Timeout") {
    REQUIRE(ToResponse(Timeout{}) == ScriptResponse{"", "Timeout"});
  }

  SECTION("KillError hides its detail") {
    REQUIRE(ToResponse(KillError{"kill(42) failed"}) == ScriptResponse{"", "Error"});
  }

  SECTION("Response JSON shape") {
    json j = ScriptResponse{"2", ""}.ToJson();
    REQUIRE(j == json{{"result", "2"}, {"error", ""}});
  }
}

TEST_CASE("Outcome kinds", "[outcome]") {
  REQUIRE(GetOutcomeKind(Success{"x"}) == OutcomeKind::kSuccess);
  REQUIRE(GetOutcomeKind(Timeout{}) == OutcomeKind::kTimeout);
  REQUIRE(std::string(OutcomeKindName(OutcomeKind::kRuntimeError)) == "runtime_error");
  REQUIRE(std::string(OutcomeKindName(OutcomeKind::kKillError)) == "kill_error");
  REQUIRE(FormatOutcome(RuntimeError{"bad"}) == "RuntimeError(\"bad\")");
  REQUIRE(FormatOutcome(Timeout{}) == "Timeout");
}

TEST_CASE("Worker result serialization", "[outcome][wire]") {
  SECTION("Outcome field is written") {
    json j = json::parse(SerializeWorkerResult(Success{"hello"}));
    REQUIRE(j["result"] == "hello");
    REQUIRE(j["error"] == "");
    REQUIRE(j["outcome"] == "success");
  }

  SECTION("KillError keeps its detail on the wire") {
    json j = json::parse(SerializeWorkerResult(KillError{"input is not JSON"}));
    REQUIRE(j["outcome"] == "kill_error");
    REQUIRE(j["error"] == "Error");
    REQUIRE(j["detail"] == "input is not JSON");
  }

  SECTION("Invalid UTF-8 in a result does not throw") {
    std::string bad = "a\xff";
    REQUIRE_NOTHROW(SerializeWorkerResult(Success{bad}));
  }

  SECTION("Timeout is not confused with a script that returns the marker") {
    REQUIRE(ParseWorkerResult(SerializeWorkerResult(Timeout{})) == ExecutionOutcome{Timeout{}});
    REQUIRE(ParseWorkerResult(SerializeWorkerResult(Success{"Timeout"})) ==
            ExecutionOutcome{Success{"Timeout"}});
  }
}

TEST_CASE("Worker result parsing", "[outcome][wire]") {
  SECTION("Empty output") {
    auto outcome = ParseWorkerResult("");
    REQUIRE(std::holds_alternative<KillError>(outcome));
  }

  SECTION("Truncated JSON") {
    auto outcome = ParseWorkerResult(R"({"result": "2", "err)");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE_THAT(std::get<KillError>(outcome).message,
                 Catch::Matchers::ContainsSubstring("malformed"));
  }

  SECTION("Not an object") {
    REQUIRE(std::holds_alternative<KillError>(ParseWorkerResult("[]")));
  }

  SECTION("Missing error field") {
    REQUIRE(std::holds_alternative<KillError>(ParseWorkerResult(R"({"result": "2"})")));
  }

  SECTION("Unknown outcome") {
    auto outcome = ParseWorkerResult(R"({"result": "", "error": "", "outcome": "maybe"})");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE_THAT(std::get<KillError>(outcome).message, Catch::Matchers::ContainsSubstring("maybe"));
  }

  SECTION("Legacy result without outcome") {
    REQUIRE(ParseWorkerResult(R"({"result": "2", "error": ""})") ==
            ExecutionOutcome{Success{"2"}});
    REQUIRE(ParseWorkerResult(R"({"result": "", "error": "Uncaught Error: x"})") ==
            ExecutionOutcome{RuntimeError{"Uncaught Error: x"}});
  }

  SECTION("Reported kill error") {
    auto outcome = ParseWorkerResult(
        R"({"result": "", "error": "Error", "outcome": "kill_error", "detail": "bad input"})");
    REQUIRE(std::holds_alternative<KillError>(outcome));
    REQUIRE_THAT(std::get<KillError>(outcome).message,
                 Catch::Matchers::ContainsSubstring("bad input"));
  }
}
