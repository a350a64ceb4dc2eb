#include "docker_args.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

const char kNameVar[] = ":name";

inline void AppendEach(std::vector<std::string>& args, const char* flag,
                       const std::vector<std::string>& values) {
  for (auto& val : values) args.insert(args.end(), {flag, val});
}

} // namespace

std::string ImageReference(const Box& box, const Step& step, const Request& req) {
  if (step.version.size()) return box.image + ":" + step.version;
  if (req.version.size()) return box.image + ":" + req.version;
  return box.image; // latest
}

std::string FormatVolume(const std::string& fmt, const std::string& dir) {
  std::string ret = fmt;
  if (size_t pos = ret.find("%s"); pos != std::string::npos) ret.replace(pos, 2, dir);
  return ret;
}

std::vector<std::string> DockerRunArgs(
    const Box& box, const Step& step, const Request& req, const std::string& dir) {
  std::vector<std::string> args = {
    ActionName(Action::RUN), "--rm",
    "--name", req.id,
    "--runtime", box.runtime,
    "--cpus", std::to_string(box.cpu),
    "--memory", std::to_string(box.memory) + "m",
    "--network", box.network,
    "--pids-limit", std::to_string(box.nproc),
    "--user", step.user,
  };
  if (!box.writable) args.push_back("--read-only");
  if (step.use_stdin) args.push_back("--interactive");
  if (box.storage.size()) args.insert(args.end(), {"--storage-opt", "size=" + box.storage});
  if (dir.size()) args.insert(args.end(), {"--volume", FormatVolume(box.volume, dir)});
  AppendEach(args, "--tmpfs", box.tmpfs);
  AppendEach(args, "--cap-add", box.cap_add);
  AppendEach(args, "--cap-drop", box.cap_drop);
  AppendEach(args, "--ulimit", box.ulimit);
  args.push_back(ImageReference(box, step, req));
  return args;
}

std::vector<std::string> DockerExecArgs(const Step& step) {
  // resource limits are those of the running container
  return {ActionName(Action::EXEC), "--interactive", "--user", step.user, step.box};
}

std::vector<std::string> DockerKillArgs(const std::string& id) {
  return {"kill", id};
}

std::vector<std::string> ExpandVars(const std::vector<std::string>& command, const Vars& vars) {
  std::vector<std::string> ret;
  ret.reserve(command.size());
  for (const auto& token : command) {
    std::string expanded = token;
    for (const auto& [var, value] : vars) {
      if (var.empty()) continue;
      if (size_t pos = expanded.find(var); pos != std::string::npos) {
        expanded.replace(pos, var.size(), value);
      }
    }
    ret.push_back(std::move(expanded));
  }
  return ret;
}

std::vector<std::string> DockerArgs(
    const Box* box, const Step& step, const Request& req, const std::string& dir) {
  std::vector<std::string> args;
  switch (step.action) {
    case Action::RUN:
      if (box) args = DockerRunArgs(*box, step, req, dir);
      break;
    case Action::EXEC:
      args = DockerExecArgs(step);
      break;
  }
  if (args.empty()) {
    // only reachable with an unvalidated config; a harmless invocation
    spdlog::warn("{}: cannot build arguments for action {} of box {}",
                 req.id, (int)step.action, step.box);
    return {"version"};
  }
  auto command = ExpandVars(step.command, {{kNameVar, req.id}});
  args.insert(args.end(), command.begin(), command.end());
  spdlog::debug("{}: {}", req.id, fmt::format("{}", args));
  return args;
}
