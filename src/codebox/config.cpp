#include <codebox/config.h>

#include <fstream>
#include <sstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codebox/paths.h>

namespace {

using nlohmann::json;

// Keys absent from obj keep their current value
template <class T>
void Get(const json& obj, const char* key, T& val) {
  if (auto it = obj.find(key); it != obj.end() && !it->is_null()) it->get_to(val);
}

void ParseBox(const json& obj, Box& box) {
  Get(obj, "image", box.image);
  Get(obj, "runtime", box.runtime);
  Get(obj, "cpu", box.cpu);
  Get(obj, "memory", box.memory);
  Get(obj, "storage", box.storage);
  Get(obj, "network", box.network);
  Get(obj, "writable", box.writable);
  Get(obj, "volume", box.volume);
  Get(obj, "tmpfs", box.tmpfs);
  Get(obj, "cap_add", box.cap_add);
  Get(obj, "cap_drop", box.cap_drop);
  Get(obj, "ulimit", box.ulimit);
  Get(obj, "nproc", box.nproc);
  Get(obj, "files", box.files);
  Get(obj, "versions", box.versions);
}

bool ParseStep(const json& obj, Step& step, std::string& err) {
  if (!obj.is_object()) {
    err = "step is not an object";
    return false;
  }
  Get(obj, "box", step.box);
  Get(obj, "version", step.version);
  Get(obj, "user", step.user);
  Get(obj, "stdin", step.use_stdin);
  Get(obj, "command", step.command);
  Get(obj, "timeout", step.timeout);
  Get(obj, "noutput", step.noutput);
  if (auto it = obj.find("action"); it != obj.end() && !it->is_null()) {
    std::string name = it->get<std::string>();
    auto action = GetAction(name);
    if (!action) {
      err = "unknown action " + name;
      return false;
    }
    step.action = *action;
  }
  return true;
}

bool ParseCommand(const json& obj, const Step& defaults, Command& cmd, std::string& err) {
  Get(obj, "entry", cmd.entry);
  if (auto it = obj.find("before"); it != obj.end() && !it->is_null()) {
    Step step = defaults;
    if (!ParseStep(*it, step, err)) return false;
    cmd.before = std::move(step);
  }
  if (auto it = obj.find("steps"); it != obj.end() && it->is_array()) {
    for (auto& i : *it) {
      Step step = defaults;
      if (!ParseStep(i, step, err)) return false;
      cmd.steps.push_back(std::move(step));
    }
  }
  if (auto it = obj.find("after"); it != obj.end() && !it->is_null()) {
    Step step = defaults;
    if (!ParseStep(*it, step, err)) return false;
    cmd.after = std::move(step);
  }
  return true;
}

bool ValidateStep(const Config& cfg, const Step& step, std::string& err) {
  if (step.command.empty()) {
    err = "empty command";
    return false;
  }
  if (step.action == Action::RUN && !cfg.FindBox(step.box)) {
    err = "unknown box " + step.box;
    return false;
  }
  if (step.action == Action::EXEC && step.box.empty()) {
    err = "exec step without a box";
    return false;
  }
  if (step.timeout <= 0) {
    err = "timeout must be positive";
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path);
  if (!fin) return false;
  std::stringstream ss;
  ss << fin.rdbuf();
  content = ss.str();
  return true;
}

} // namespace

const Box* Config::FindBox(const std::string& name) const {
  auto it = boxes.find(name);
  return it == boxes.end() ? nullptr : &it->second;
}

const Command* Config::FindCommand(const std::string& sandbox, const std::string& command) const {
  auto it = commands.find(sandbox);
  if (it == commands.end()) return nullptr;
  auto cmd = it->second.find(command);
  return cmd == it->second.end() ? nullptr : &cmd->second;
}

static const char* kActionNameTable[] = {
#define X(name, str) str,
  ENUM_ACTION_
#undef X
};

const char* ActionName(Action action) {
  return kActionNameTable[(int)action];
}

std::optional<Action> GetAction(const std::string& str) {
  for (size_t i = 0; i < sizeof(kActionNameTable) / sizeof(kActionNameTable[0]); i++) {
    if (str == kActionNameTable[i]) return (Action)i;
  }
  return std::nullopt;
}

bool ParseDefaults(const std::string& json_text, Config& cfg, std::string& err) {
  try {
    json obj = json::parse(json_text);
    if (auto it = obj.find("box"); it != obj.end()) ParseBox(*it, cfg.box_defaults);
    if (auto it = obj.find("step"); it != obj.end()) {
      if (!ParseStep(*it, cfg.step_defaults, err)) return false;
    }
    return true;
  } catch (const json::exception& e) {
    err = e.what();
    return false;
  }
}

bool ParseBoxes(const std::string& json_text, Config& cfg, std::string& err) {
  try {
    json obj = json::parse(json_text);
    if (!obj.is_object()) {
      err = "boxes must be an object";
      return false;
    }
    for (auto& [name, val] : obj.items()) {
      Box box = cfg.box_defaults;
      ParseBox(val, box);
      if (box.image.empty()) {
        err = "box " + name + " has no image";
        return false;
      }
      cfg.boxes[name] = std::move(box);
    }
    return true;
  } catch (const json::exception& e) {
    err = e.what();
    return false;
  }
}

bool ParseCommands(const std::string& sandbox, const std::string& json_text, Config& cfg, std::string& err) {
  try {
    json obj = json::parse(json_text);
    if (!obj.is_object()) {
      err = "commands must be an object";
      return false;
    }
    auto& commands = cfg.commands[sandbox];
    for (auto& [name, val] : obj.items()) {
      Command cmd;
      if (!ParseCommand(val, cfg.step_defaults, cmd, err)) {
        err = sandbox + "." + name + ": " + err;
        return false;
      }
      commands[name] = std::move(cmd);
    }
    return true;
  } catch (const json::exception& e) {
    err = sandbox + ": " + e.what();
    return false;
  }
}

bool ValidateConfig(const Config& cfg, std::string& err) {
  for (auto& [sandbox, commands] : cfg.commands) {
    for (auto& [name, cmd] : commands) {
      std::string prefix = sandbox + "." + name + ": ";
      if (cmd.steps.empty()) {
        err = prefix + "no steps";
        return false;
      }
      if (cmd.before && !ValidateStep(cfg, *cmd.before, err)) {
        err = prefix + "before: " + err;
        return false;
      }
      for (size_t i = 0; i < cmd.steps.size(); i++) {
        if (!ValidateStep(cfg, cmd.steps[i], err)) {
          err = prefix + "step " + std::to_string(i) + ": " + err;
          return false;
        }
      }
      if (cmd.after && !ValidateStep(cfg, *cmd.after, err)) {
        err = prefix + "after: " + err;
        return false;
      }
    }
  }
  return true;
}

bool LoadConfig(const fs::path& dir, Config& cfg) {
  spdlog::info("Loading configuration from {}", dir.c_str());
  std::string content, err;
  if (fs::path path = DefaultsConfigFile(dir); ReadFile(path, content)) {
    if (!ParseDefaults(content, cfg, err)) {
      spdlog::error("Invalid {}: {}", path.c_str(), err);
      return false;
    }
  }
  fs::path boxes_path = BoxesConfigFile(dir);
  if (!ReadFile(boxes_path, content)) {
    spdlog::error("Cannot read {}", boxes_path.c_str());
    return false;
  }
  if (!ParseBoxes(content, cfg, err)) {
    spdlog::error("Invalid {}: {}", boxes_path.c_str(), err);
    return false;
  }

  std::vector<fs::path> command_files;
  std::error_code ec;
  for (fs::directory_iterator it(CommandsConfigDir(dir), ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() == ".json") command_files.push_back(it->path());
  }
  if (ec) {
    spdlog::error("Cannot list {}: {}", CommandsConfigDir(dir).c_str(), ec.message());
    return false;
  }
  std::sort(command_files.begin(), command_files.end());
  for (auto& path : command_files) {
    if (!ReadFile(path, content)) {
      spdlog::error("Cannot read {}", path.c_str());
      return false;
    }
    if (!ParseCommands(path.stem().string(), content, cfg, err)) {
      spdlog::error("Invalid {}: {}", path.c_str(), err);
      return false;
    }
    spdlog::debug("Loaded commands of sandbox {}", path.stem().string());
  }

  if (!ValidateConfig(cfg, err)) {
    spdlog::error("Invalid configuration: {}", err);
    return false;
  }
  spdlog::info("Loaded {} boxes and {} sandboxes", cfg.boxes.size(), cfg.commands.size());
  return true;
}
