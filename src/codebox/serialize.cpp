#include <codebox/serialize.h>

#include <nlohmann/json.hpp>

namespace {

// null is the same as absent
std::string GetString(const nlohmann::ordered_json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return "";
  return it->get<std::string>();
}

} // namespace

ExecError ParseRequest(const std::string& body, Request& req) {
  // ordered_json keeps the order of the files as sent
  using nlohmann::ordered_json;
  try {
    ordered_json obj = ordered_json::parse(body);
    if (!obj.is_object()) return ExecError(ErrorKind::ARGUMENT, "request must be an object");
    req.sandbox = GetString(obj, "sandbox");
    req.command = GetString(obj, "command");
    req.version = GetString(obj, "version");
    if (auto it = obj.find("files"); it != obj.end() && !it->is_null()) {
      if (!it->is_object()) return ExecError(ErrorKind::ARGUMENT, "files must be an object");
      for (auto& [name, content] : it->items()) {
        if (!req.files.Add(name, content.get<std::string>())) {
          return ExecError(ErrorKind::ARGUMENT, "duplicate file " + name);
        }
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return ExecError(ErrorKind::ARGUMENT, std::string("invalid request: ") + e.what());
  }
  return ExecError();
}

std::string DumpExecution(const Execution& exec) {
  nlohmann::json ret = {
    {"id", exec.id},
    {"ok", exec.ok},
    {"duration", exec.duration_ms},
    {"stdout", exec.stdout_str},
    {"stderr", exec.stderr_str},
  };
  if (exec.error.kind != ErrorKind::NONE) {
    ret["error"] = {
      {"kind", ErrorKindName(exec.error.kind)},
      {"message", exec.error.message},
    };
  }
  // program output may not be valid UTF-8
  return ret.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
