#include <filesystem>
#include <string>

#include <fmt/format.h>

#include "config/service_config.h"
#include "logging/trace.h"
#include "service/http_server.h"
#include "service/script_service.h"

using namespace script_runner;

namespace {

void PrintUsage(const char* prog) {
  fmt::print(
      "Usage: {} [--config <config.json>] [--port N] [--mode subprocess|in_process]\n"
      "       [--worker <script_worker path>] [--quiet]\n",
      prog);
}

// script_worker is installed beside the server executable.
std::string DefaultWorkerPath(const char* argv0) {
  std::error_code ec;
  std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    self = std::filesystem::absolute(argv0, ec);
  }
  return (self.parent_path() / "script_worker").string();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string port_flag;
  std::string mode_flag;
  std::string worker_flag;
  bool quiet = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      port_flag = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      mode_flag = argv[++i];
    } else if (arg == "--worker" && i + 1 < argc) {
      worker_flag = argv[++i];
    } else if (arg == "--quiet") {
      quiet = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      PrintUsage(argv[0]);
      return 1;
    }
  }

  ServiceConfig config = ServiceConfig::Default();
  std::string error;

  if (!config_path.empty() && !config.LoadFromFile(config_path, &error)) {
    fmt::print(stderr, "Error loading config: {}\n", error);
    return 1;
  }
  if (!config.ApplyEnvironment(&error)) {
    fmt::print(stderr, "Error in environment: {}\n", error);
    return 1;
  }

  if (!port_flag.empty()) {
    try {
      config.port = std::stoi(port_flag);
    } catch (const std::exception&) {
      fmt::print(stderr, "Error: invalid port '{}'\n", port_flag);
      return 1;
    }
  }
  if (!mode_flag.empty() && !ParseWorkerMode(mode_flag, config.worker_mode)) {
    fmt::print(stderr, "Error: unknown worker mode '{}'\n", mode_flag);
    return 1;
  }
  if (!worker_flag.empty()) {
    config.worker_path = worker_flag;
  }
  if (quiet) {
    config.trace_enabled = false;
  }
  if (config.worker_path.empty()) {
    config.worker_path = DefaultWorkerPath(argv[0]);
  }

  if (!config.Validate(&error)) {
    fmt::print(stderr, "Invalid configuration: {}\n", error);
    return 1;
  }

  Tracer::SetEnabled(config.trace_enabled);

  ScriptService service(config);
  HttpServer server(service);

  Tracer::LogServerStart(config.host, config.port, WorkerModeName(config.worker_mode),
                         config.limits.max_execution_time_ms,
                         config.limits.max_heap_size_bytes,
                         config.EffectiveHardTimeoutMs());

  if (!server.Listen(config.host, config.port, &error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }
  return 0;
}
