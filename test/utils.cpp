#include "utils.h"

#include <stdlib.h>
#include <algorithm>

void FakeRunner::On(const std::string& token, const ProgramResult& res) {
  rules_.emplace_back(token, res);
}

ProgramResult FakeRunner::Run(const ProgramOptions& opt) const {
  {
    std::lock_guard lck(mtx_);
    calls_.push_back(opt);
  }
  if (on_run) on_run(opt);
  for (auto& [token, res] : rules_) {
    if (HasArg(opt.args, token)) return res;
  }
  return OkResult();
}

std::vector<ProgramOptions> FakeRunner::Calls() const {
  std::lock_guard lck(mtx_);
  return calls_;
}

size_t FakeRunner::CountCalls(const std::string& token) const {
  std::lock_guard lck(mtx_);
  return std::count_if(calls_.begin(), calls_.end(),
      [&](const ProgramOptions& opt) { return HasArg(opt.args, token); });
}

ProgramResult OkResult(const std::string& out, const std::string& err) {
  ProgramResult res;
  res.status = ProgramStatus::OK;
  res.exit_code = 0;
  res.stdout_str = out;
  res.stderr_str = err;
  return res;
}

ProgramResult ExitedResult(int code, const std::string& out, const std::string& err) {
  ProgramResult res;
  res.status = ProgramStatus::EXITED;
  res.exit_code = code;
  res.stdout_str = out;
  res.stderr_str = err;
  res.detail = "exit status " + std::to_string(code);
  return res;
}

ProgramResult TimeoutResult() {
  ProgramResult res;
  res.status = ProgramStatus::TIMEOUT;
  res.detail = "signal: killed";
  return res;
}

ProgramResult FailedResult(const std::string& detail) {
  ProgramResult res;
  res.status = ProgramStatus::FAILED;
  res.detail = detail;
  return res;
}

TaskSpawner SyncSpawner() {
  return [](std::function<void()> task) { task(); };
}

std::string ArgAfter(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || ++it == args.end()) return "";
  return *it;
}

bool HasArg(const std::vector<std::string>& args, const std::string& arg) {
  return std::find(args.begin(), args.end(), arg) != args.end();
}

Step ExampleStep(const std::string& box, const std::vector<std::string>& command) {
  Step step;
  step.box = box;
  step.command = command;
  return step;
}

Config ExampleConfig() {
  Config cfg;
  Box box;
  box.image = "python";
  box.versions = {"1.0", "2.0"};
  cfg.boxes["python"] = box;
  Command cmd;
  cmd.entry = "main.py";
  cmd.steps.push_back(ExampleStep("python", {"python", "main.py"}));
  cfg.commands["python"]["run"] = cmd;
  return cfg;
}

void TempDirTest::SetUp() {
  std::string tmpl = (fs::temp_directory_path() / "codebox-test-XXXXXX").string();
  ASSERT_NE(mkdtemp(tmpl.data()), nullptr);
  temp_dir = tmpl;
}

void TempDirTest::TearDown() {
  std::error_code ec;
  // staged files are read-only, but their directories are not
  fs::remove_all(temp_dir, ec);
}
