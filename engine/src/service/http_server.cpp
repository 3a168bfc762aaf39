#include "service/http_server.h"

#include <httplib.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "service/script_service.h"

namespace script_runner {

namespace {

constexpr const char* kJsonContentType = "application/json";

void WriteReply(const ServiceReply& reply, httplib::Response& res) {
  res.status = reply.status;
  res.set_content(reply.response.ToJson().dump(-1, ' ', false,
                                               nlohmann::json::error_handler_t::replace),
                  kJsonContentType);
}

}  // namespace

HttpServer::HttpServer(ScriptService& service)
    : service_(service), server_(std::make_unique<httplib::Server>()) {
  RegisterRoutes();
}

HttpServer::~HttpServer() = default;

void HttpServer::RegisterRoutes() {
  server_->Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("200 OK", "text/plain");
  });

  server_->Post("/", [this](const httplib::Request& req, httplib::Response& res) {
    // httplib decodes application/x-www-form-urlencoded bodies into params.
    if (req.has_param("script")) {
      WriteReply(service_.HandleScript(req.get_param_value("script")), res);
      return;
    }
    WriteReply(service_.HandleJson(req.body), res);
  });

  server_->set_exception_handler(
      [](const httplib::Request&, httplib::Response& res, std::exception_ptr) {
        WriteReply(ServiceReply{500, ScriptResponse{"", kErrorMarker}}, res);
      });
}

bool HttpServer::Listen(const std::string& host, int port, std::string* error_out) {
  if (!server_->bind_to_port(host, port)) {
    if (error_out) *error_out = fmt::format("cannot bind {}:{}", host, port);
    return false;
  }
  if (!server_->listen_after_bind()) {
    if (error_out) *error_out = fmt::format("server on {}:{} stopped with an error", host, port);
    return false;
  }
  return true;
}

void HttpServer::Stop() {
  server_->stop();
}

}  // namespace script_runner
