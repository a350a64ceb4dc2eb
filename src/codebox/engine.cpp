#include <codebox/engine.h>

#include <cctype>
#include <chrono>
#include <thread>
#include <system_error>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "docker_args.h"
#include "fileio.h"
#include "utils.h"

TaskSpawner DetachedSpawner() {
  return [](std::function<void()> task) {
    std::thread thread(std::move(task));
    thread.detach();
  };
}

EngineOptions::EngineOptions() :
    runtime(kRuntime),
    box_root(kBoxRoot),
    kill_timeout_ms(kKillTimeoutMs),
    runner(std::make_shared<ForkProgramRunner>()),
    spawn(DetachedSpawner()) {}

DockerEngine::DockerEngine(const Config& cfg, const Command& cmd, EngineOptions opt) :
    cfg_(cfg), cmd_(cmd), opt_(std::move(opt)) {}

Execution DockerEngine::Exec(const Request& req) {
  auto start = std::chrono::steady_clock::now();
  Execution out;
  if (cmd_.steps.empty()) {
    out = Fail(req.id, ExecError(ErrorKind::CONFIG, "command has no steps"));
  } else if (auto path = MakeTempDir(opt_.box_root); !path) {
    out = FailStage(req.id, "create temp dir", "");
  } else {
    // all steps operate in the same scratch directory
    ScratchDir dir(std::move(*path));
    // without an entry point, the command does not read the request files
    if (cmd_.entry.size() && !WriteFiles(dir.Path(), req.files)) {
      out = FailStage(req.id, "write files to temp dir", "");
    } else {
      out = ExecSteps(req, dir.Path());
    }
  }
  out.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  spdlog::info("{}: finished ok={} duration={}ms", req.id, out.ok, out.duration_ms);
  return out;
}

Execution DockerEngine::ExecSteps(const Request& req, const fs::path& dir) const {
  if (cmd_.before) {
    // a failed setup skips the cleanup step too
    Execution before = ExecStep(*cmd_.before, req, dir, nullptr);
    if (!before.ok) return before;
  }

  Execution ret = ExecStep(cmd_.steps[0], req, dir, &req.files);
  // later steps work on the artifacts of the previous ones, not on the request files
  for (size_t i = 1; ret.ok && i < cmd_.steps.size(); i++) {
    ret = ExecStep(cmd_.steps[i], req, dir, nullptr);
  }

  if (cmd_.after) {
    Execution after = ExecStep(*cmd_.after, req, dir, nullptr);
    if (ret.ok && !after.ok) return after;
    if (!after.ok) {
      spdlog::info("{}: cleanup step failed after a failed run: {}", req.id, after.error.message);
    }
  }
  return ret;
}

bool DockerEngine::WriteFiles(const fs::path& dir, const Files& files) const {
  return StageFiles(dir, files, cmd_.entry);
}

Execution DockerEngine::ExecStep(const Step& step, const Request& req,
                                 const fs::path& dir, const Files* files) const {
  const Box* box = cfg_.FindBox(step.box);
  // a pinned step version wins; no request version means the latest
  if (step.version.empty() && req.version.size()) {
    if (!box || std::find(box->versions.begin(), box->versions.end(), req.version) == box->versions.end()) {
      return Fail(req.id, ExecError(ErrorKind::CONFIG,
          "box " + step.box + " does not support version " + req.version));
    }
  }
  if (box) {
    for (auto& pattern : box->files) {
      if (!CopyFiles(pattern, dir, kPerm444)) return FailStage(req.id, "copy files to temp dir", "");
    }
  }
  return Invoke(box, step, req, dir, files);
}

Execution DockerEngine::Invoke(const Box* box, const Step& step, const Request& req,
                               const fs::path& dir, const Files* files) const {
  ProgramOptions prog;
  prog.id = req.id;
  prog.name = opt_.runtime;
  prog.args = DockerArgs(box, step, req, dir.string());
  prog.timeout_ms = step.timeout * 1000L;
  prog.max_output = step.noutput;
  if (step.use_stdin) {
    // files are piped to the container instead of being read from the mounted directory
    prog.has_input = true;
    if (files) prog.input = files->Concat();
  }
  ProgramResult res = opt_.runner->Run(prog);

  switch (res.status) {
    case ProgramStatus::OK:
      return Success(req.id, std::move(res.stdout_str), std::move(res.stderr_str));
    case ProgramStatus::TIMEOUT:
      // killing the runtime client does not stop the process inside the container
      if (step.action == Action::RUN) KillContainer(req.id);
      return Fail(req.id, ExecError(ErrorKind::TIMEOUT, kTimeoutMessage));
    case ProgramStatus::EXITED: {
      // the code failed, not the sandbox; keep its output as a single block
      std::string combined = res.stdout_str + res.stderr_str;
      std::string message = combined.empty() ? res.detail : combined + " (" + res.detail + ")";
      Execution ret = Fail(req.id, ExecError(ErrorKind::CODE, std::move(message)));
      ret.stderr_str = std::move(combined);
      return ret;
    }
    case ProgramStatus::FAILED:
      return FailStage(req.id, "execute code", res.detail);
  }
  __builtin_unreachable();
}

void DockerEngine::KillContainer(const std::string& id) const {
  ProgramOptions prog;
  prog.id = id;
  prog.name = opt_.runtime;
  prog.args = DockerKillArgs(id);
  prog.timeout_ms = opt_.kill_timeout_ms;
  std::string name = prog.name;
  try {
    opt_.spawn([runner = opt_.runner, prog = std::move(prog)]() {
      ProgramResult res = runner->Run(prog);
      if (res.status == ProgramStatus::OK) {
        spdlog::debug("{}: {} kill ok", prog.id, prog.name);
      } else {
        spdlog::warn("{}: {} kill failed: {} {}", prog.id, prog.name,
                     ProgramStatusName(res.status), res.detail);
      }
    });
  } catch (const std::system_error& e) {
    // the timeout result stands
    spdlog::warn("{}: cannot spawn {} kill: {}", id, name, e.what());
  }
}

std::string NewExecutionId(const std::string& sandbox, const std::string& command) {
  std::string ret = sandbox + "_" + command + "_" + RandomHex(8);
  // container names allow [a-zA-Z0-9][a-zA-Z0-9_.-]
  for (auto& c : ret) {
    if (!isalnum((unsigned char)c) && c != '_' && c != '.' && c != '-') c = '_';
  }
  return ret;
}

ExecError ValidateRequest(const Config& cfg, const Request& req) {
  if (req.sandbox.empty()) return ExecError(ErrorKind::ARGUMENT, "missing sandbox");
  if (req.command.empty()) return ExecError(ErrorKind::ARGUMENT, "missing command");
  if (!cfg.commands.count(req.sandbox)) {
    return ExecError(ErrorKind::ARGUMENT, "unknown sandbox " + req.sandbox);
  }
  if (!cfg.FindCommand(req.sandbox, req.command)) {
    return ExecError(ErrorKind::ARGUMENT, "unknown command " + req.sandbox + "." + req.command);
  }
  if (req.files.empty()) return ExecError(ErrorKind::ARGUMENT, "empty files");
  return ExecError();
}

Execution Exec(const Config& cfg, Request req, const EngineOptions& opt) {
  if (req.id.empty()) req.id = NewExecutionId(req.sandbox, req.command);
  if (ExecError err = ValidateRequest(cfg, req); err.kind != ErrorKind::NONE) {
    spdlog::info("{}: rejected: {}", req.id, err.message);
    return Fail(req.id, std::move(err));
  }
  spdlog::info("{}: exec {}.{} version={} files={}",
               req.id, req.sandbox, req.command, req.version, req.files.size());
  DockerEngine engine(cfg, *cfg.FindCommand(req.sandbox, req.command), opt);
  return engine.Exec(req);
}
