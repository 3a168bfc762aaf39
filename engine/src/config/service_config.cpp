#include "config/service_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace script_runner {

namespace {

bool ReadEnvUnsigned(const char* name, uint64_t& out, std::string* error_out) {
  const char* value = std::getenv(name);
  if (!value) {
    return true;
  }
  if (!ParseUnsigned(value, out)) {
    if (error_out) {
      *error_out = fmt::format("{} must be a non-negative integer (got '{}')", name, value);
    }
    return false;
  }
  return true;
}

// Read a non-negative integer key; negative or fractional numbers are errors.
bool ReadJsonUnsigned(const nlohmann::json& j, const char* key, uint64_t& out,
                      std::string* error_out) {
  auto it = j.find(key);
  if (it == j.end()) {
    return true;
  }
  if (!it->is_number_unsigned()) {
    if (error_out) {
      *error_out = fmt::format("{} must be a non-negative integer (got {})", key, it->dump());
    }
    return false;
  }
  out = it->get<uint64_t>();
  return true;
}

}  // namespace

bool ParseUnsigned(const std::string& text, uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  try {
    out = std::stoull(text);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

bool ParseWorkerMode(const std::string& name, WorkerMode& out) {
  if (name == "subprocess") {
    out = WorkerMode::kSubprocess;
    return true;
  }
  if (name == "in_process") {
    out = WorkerMode::kInProcess;
    return true;
  }
  return false;
}

const char* WorkerModeName(WorkerMode mode) {
  switch (mode) {
    case WorkerMode::kSubprocess:
      return "subprocess";
    case WorkerMode::kInProcess:
      return "in_process";
  }
  return "unknown";
}

ServiceConfig ServiceConfig::Default() {
  return ServiceConfig{};
}

bool ServiceConfig::LoadFromJson(const std::string& json_str, std::string* error_out) {
  try {
    auto j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      if (error_out) *error_out = "Config must be a JSON object";
      return false;
    }

    if (!ReadJsonUnsigned(j, "max_execution_time_ms", limits.max_execution_time_ms, error_out) ||
        !ReadJsonUnsigned(j, "max_heap_size_bytes", limits.max_heap_size_bytes, error_out) ||
        !ReadJsonUnsigned(j, "hard_timeout_ms", hard_timeout_ms, error_out) ||
        !ReadJsonUnsigned(j, "kill_grace_ms", kill_grace_ms, error_out) ||
        !ReadJsonUnsigned(j, "max_output_bytes", max_output_bytes, error_out)) {
      return false;
    }
    if (j.contains("worker_mode")) {
      std::string mode = j["worker_mode"].get<std::string>();
      if (!ParseWorkerMode(mode, worker_mode)) {
        if (error_out) *error_out = "Unknown worker_mode: " + mode;
        return false;
      }
    }
    if (j.contains("worker_path")) {
      worker_path = j["worker_path"].get<std::string>();
    }
    if (j.contains("host")) {
      host = j["host"].get<std::string>();
    }
    if (j.contains("port")) {
      port = j["port"].get<int>();
    }
    if (j.contains("trace_enabled")) {
      trace_enabled = j["trace_enabled"].get<bool>();
    }
    return true;
  } catch (const std::exception& e) {
    if (error_out) *error_out = std::string("Config parse error: ") + e.what();
    return false;
  }
}

bool ServiceConfig::LoadFromFile(const std::string& path, std::string* error_out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    if (error_out) *error_out = "Failed to open config file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromJson(buffer.str(), error_out);
}

bool ServiceConfig::ApplyEnvironment(std::string* error_out) {
  uint64_t port_value = static_cast<uint64_t>(port);
  if (!ReadEnvUnsigned("PORT", port_value, error_out) ||
      !ReadEnvUnsigned("MAX_EXECUTION_TIME_MS", limits.max_execution_time_ms, error_out) ||
      !ReadEnvUnsigned("MAX_HEAP_SIZE_BYTES", limits.max_heap_size_bytes, error_out) ||
      !ReadEnvUnsigned("HARD_TIMEOUT_MS", hard_timeout_ms, error_out)) {
    return false;
  }
  if (port_value > 65535) {
    if (error_out) *error_out = fmt::format("PORT out of range: {}", port_value);
    return false;
  }
  port = static_cast<int>(port_value);

  if (const char* mode = std::getenv("WORKER_MODE")) {
    if (!ParseWorkerMode(mode, worker_mode)) {
      if (error_out) *error_out = fmt::format("Unknown WORKER_MODE: {}", mode);
      return false;
    }
  }
  if (const char* path = std::getenv("WORKER_PATH")) {
    worker_path = path;
  }
  return true;
}

bool ServiceConfig::Validate(std::string* error_out) const {
  if (limits.max_execution_time_ms == 0) {
    if (error_out) *error_out = "max_execution_time_ms must be > 0";
    return false;
  }
  if (limits.max_heap_size_bytes == 0) {
    if (error_out) *error_out = "max_heap_size_bytes must be > 0";
    return false;
  }
  if (limits.max_execution_time_ms > kMaxTimeoutMs) {
    if (error_out) {
      *error_out = fmt::format("max_execution_time_ms must be <= {}", kMaxTimeoutMs);
    }
    return false;
  }
  if (hard_timeout_ms > kMaxTimeoutMs) {
    if (error_out) *error_out = fmt::format("hard_timeout_ms must be <= {}", kMaxTimeoutMs);
    return false;
  }
  if (kill_grace_ms > kMaxTimeoutMs) {
    if (error_out) *error_out = fmt::format("kill_grace_ms must be <= {}", kMaxTimeoutMs);
    return false;
  }
  if (hard_timeout_ms != 0 && hard_timeout_ms < limits.max_execution_time_ms) {
    if (error_out) {
      *error_out = fmt::format("hard_timeout_ms ({}) must be >= max_execution_time_ms ({})",
                               hard_timeout_ms, limits.max_execution_time_ms);
    }
    return false;
  }
  if (max_output_bytes == 0) {
    if (error_out) *error_out = "max_output_bytes must be > 0";
    return false;
  }
  if (port < 0 || port > 65535) {
    if (error_out) *error_out = fmt::format("port out of range: {}", port);
    return false;
  }
  return true;
}

}  // namespace script_runner
