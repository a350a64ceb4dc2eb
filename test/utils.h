#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <vector>
#include <string>
#include <functional>
#include <filesystem>

#include <gtest/gtest.h>
#include <codebox/config.h>
#include <codebox/engine.h>
#include <codebox/program.h>

namespace fs = std::filesystem;

// Records invocations and answers with scripted results
class FakeRunner : public ProgramRunner {
  mutable std::mutex mtx_;
  mutable std::vector<ProgramOptions> calls_;
  std::vector<std::pair<std::string, ProgramResult>> rules_;
 public:
  // called on every Run, before the result is returned
  std::function<void(const ProgramOptions&)> on_run;

  // calls with an argument equal to token get res; the first matching rule wins
  void On(const std::string& token, const ProgramResult& res);

  ProgramResult Run(const ProgramOptions&) const override;

  std::vector<ProgramOptions> Calls() const;
  size_t CountCalls(const std::string& token) const;
};

ProgramResult OkResult(const std::string& out = "", const std::string& err = "");
ProgramResult ExitedResult(int code, const std::string& out, const std::string& err);
ProgramResult TimeoutResult();
ProgramResult FailedResult(const std::string& detail);

// Runs spawned tasks immediately
TaskSpawner SyncSpawner();

// the value following flag in args, or "" if absent
std::string ArgAfter(const std::vector<std::string>& args, const std::string& flag);
bool HasArg(const std::vector<std::string>& args, const std::string& arg);

// Box "python" (versions 1.0, 2.0) and sandbox "python" with command "run"
// (entry main.py, one step running `python main.py`)
Config ExampleConfig();
Step ExampleStep(const std::string& box, const std::vector<std::string>& command);

class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  fs::path temp_dir;
};

#endif // TEST_UTILS_H_
