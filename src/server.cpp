#include "server.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codebox/serialize.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 1313;

namespace {

const char kJsonType[] = "application/json";

} // namespace

std::string HandleExec(const Config& cfg, const EngineOptions& opt, const std::string& body, int& status) {
  Request req;
  if (ExecError err = ParseRequest(body, req); err.kind != ErrorKind::NONE) {
    status = 400;
    return DumpExecution(Fail("", std::move(err)));
  }
  Execution out = Exec(cfg, std::move(req), opt);
  // a failure of the submitted code is a successful request
  if (out.error.kind == ErrorKind::ARGUMENT) {
    status = 400;
  } else if (IsInfrastructureError(out.error.kind)) {
    status = 500;
  } else {
    status = 200;
  }
  return DumpExecution(out);
}

bool ServeHTTP(const Config& cfg, const EngineOptions& opt) {
  httplib::Server server;
  server.Post("/v1/exec", [&](const httplib::Request& req, httplib::Response& res) {
    spdlog::debug("POST /v1/exec from {} ({} bytes)", req.remote_addr, req.body.size());
    int status = 200;
    std::string body = HandleExec(cfg, opt, req.body, status);
    res.status = status;
    res.set_content(body, kJsonType);
  });
  server.Get("/v1/sandboxes", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json sandboxes = nlohmann::json::array();
    for (auto& [sandbox, commands] : cfg.commands) sandboxes.push_back(sandbox);
    res.set_content(sandboxes.dump(), kJsonType);
  });
  server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {}", req.method, req.path, res.status);
  });
  spdlog::warn("Listening on {}:{}", kListenHost, kListenPort);
  if (!server.listen(kListenHost.c_str(), kListenPort)) {
    spdlog::error("Cannot listen on {}:{}", kListenHost, kListenPort);
    return false;
  }
  return true;
}
