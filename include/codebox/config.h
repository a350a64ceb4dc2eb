#ifndef INCLUDE_CODEBOX_CONFIG_H_
#define INCLUDE_CODEBOX_CONFIG_H_

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#define ENUM_ACTION_ \
  X(RUN, "run") /* start a fresh container */ \
  X(EXEC, "exec") /* attach to a running container named after the box */
enum class Action {
#define X(name, str) name,
  ENUM_ACTION_
#undef X
};

// Resource envelope and isolation policy of a container
struct Box {
  std::string image;
  std::string runtime;
  int cpu;
  int memory; // MiB
  std::string storage; // empty for no quota
  std::string network;
  bool writable;
  std::string volume; // "%s" is replaced by the scratch directory
  std::vector<std::string> tmpfs;
  std::vector<std::string> cap_add, cap_drop;
  std::vector<std::string> ulimit;
  int nproc;
  // glob patterns copied into every scratch directory
  std::vector<std::string> files;
  std::vector<std::string> versions;

  Box() :
      runtime("runc"),
      cpu(1),
      memory(64),
      network("none"),
      writable(false),
      volume("%s:/sandbox:ro"),
      tmpfs{"/tmp:rw,size=16m"},
      cap_drop{"all"},
      ulimit{"nofile=96"},
      nproc(64) {}
};

struct Step {
  std::string box;
  std::string version; // pinned image version; overrides the request
  std::string user;
  Action action;
  bool use_stdin; // deliver the files through stdin instead of the mounted directory
  // ":name" is replaced by the execution id
  std::vector<std::string> command;
  int timeout; // seconds
  long noutput; // bytes per stream

  Step() :
      user("sandbox"),
      action(Action::RUN),
      use_stdin(false),
      timeout(5),
      noutput(4096) {}
};

struct Command {
  std::string entry; // file name of the entry point; empty if no files are needed
  std::optional<Step> before;
  std::vector<Step> steps; // non-empty
  std::optional<Step> after;
};

struct Config {
  Box box_defaults;
  Step step_defaults;
  std::map<std::string, Box> boxes;
  // sandbox -> command name -> command
  std::map<std::string, std::map<std::string, Command>> commands;

  const Box* FindBox(const std::string& name) const;
  const Command* FindCommand(const std::string& sandbox, const std::string& command) const;
};

const char* ActionName(Action);
std::optional<Action> GetAction(const std::string&);

// Read config.json (optional), boxes.json and commands/*.json under dir
bool LoadConfig(const std::filesystem::path& dir, Config& cfg);
// Exposed for testing; on error, err describes the offending entry
bool ParseBoxes(const std::string& json_text, Config& cfg, std::string& err);
bool ParseCommands(const std::string& sandbox, const std::string& json_text, Config& cfg, std::string& err);
bool ParseDefaults(const std::string& json_text, Config& cfg, std::string& err);
bool ValidateConfig(const Config& cfg, std::string& err);

#endif  // INCLUDE_CODEBOX_CONFIG_H_
