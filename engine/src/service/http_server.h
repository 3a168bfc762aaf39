#pragma once

#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace script_runner {

class ScriptService;

/**
 * HTTP endpoint in front of a ScriptService.
 *
 *   GET  /  health check, "200 OK"
 *   POST /  {"script": ...} as JSON, or a form field named "script"
 */
class HttpServer {
 public:
  explicit HttpServer(ScriptService& service);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * Bind and serve until Stop() is called.
   * Returns false and sets error_out if the address cannot be bound.
   */
  bool Listen(const std::string& host, int port, std::string* error_out = nullptr);

  /**
   * Stop a running Listen() from another thread.
   */
  void Stop();

 private:
  void RegisterRoutes();

  ScriptService& service_;
  std::unique_ptr<httplib::Server> server_;
};

}  // namespace script_runner
