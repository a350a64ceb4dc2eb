#ifndef INCLUDE_CODEBOX_ENGINE_H_
#define INCLUDE_CODEBOX_ENGINE_H_

#include <memory>
#include <string>
#include <functional>
#include <filesystem>

#include "config.h"
#include "program.h"
#include "execution.h"

// Runs a unit of work without waiting for it
using TaskSpawner = std::function<void(std::function<void()>)>;

// Spawns a detached std::thread
TaskSpawner DetachedSpawner();

struct EngineOptions {
  std::string runtime; // container runtime binary
  std::filesystem::path box_root; // parent of the scratch directories
  long kill_timeout_ms;
  std::shared_ptr<const ProgramRunner> runner;
  TaskSpawner spawn;

  // docker; kBoxRoot; 5s; ForkProgramRunner; DetachedSpawner
  EngineOptions();
};

class Engine {
 public:
  virtual ~Engine() = default;
  virtual Execution Exec(const Request&) = 0;
};

// Executes a command through the `run` / `exec` actions of a docker-compatible runtime.
// The config and the command must outlive the engine.
class DockerEngine : public Engine {
  const Config& cfg_;
  const Command& cmd_;
  EngineOptions opt_;

  Execution ExecSteps(const Request& req, const std::filesystem::path& dir) const;
  Execution ExecStep(const Step& step, const Request& req,
                     const std::filesystem::path& dir, const Files* files) const;
  Execution Invoke(const Box* box, const Step& step, const Request& req,
                   const std::filesystem::path& dir, const Files* files) const;
  bool WriteFiles(const std::filesystem::path& dir, const Files& files) const;
  void KillContainer(const std::string& id) const;
 public:
  DockerEngine(const Config& cfg, const Command& cmd, EngineOptions opt = EngineOptions());

  Execution Exec(const Request&) override;
};

// <sandbox>_<command>_<random hex>; valid as a container name
std::string NewExecutionId(const std::string& sandbox, const std::string& command);

// ARGUMENT error for unknown sandbox/command or empty files
ExecError ValidateRequest(const Config& cfg, const Request& req);

// Validate, assign an id if missing, and run the command of the request
Execution Exec(const Config& cfg, Request req, const EngineOptions& opt = EngineOptions());

#endif  // INCLUDE_CODEBOX_ENGINE_H_
