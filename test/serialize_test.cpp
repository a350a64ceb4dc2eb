#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codebox/serialize.h>
#include "server.h"
#include "utils.h"

namespace {

using nlohmann::json;

TEST(ParseRequestTest, Basic) {
  Request req;
  ExecError err = ParseRequest(R"js({
    "sandbox": "python", "command": "run", "version": "3.12",
    "files": {"": "print(1)", "b.py": "b", "a.py": "a"}
  })js", req);
  ASSERT_EQ(err.kind, ErrorKind::NONE) << err.message;
  EXPECT_EQ(req.sandbox, "python");
  EXPECT_EQ(req.command, "run");
  EXPECT_EQ(req.version, "3.12");
  ASSERT_EQ(req.files.size(), 3u);
  auto it = req.files.begin();
  EXPECT_EQ(it++->first, "");
  EXPECT_EQ(it++->first, "b.py");
  EXPECT_EQ(it++->first, "a.py");
  EXPECT_EQ(req.files.Concat(), "print(1)ba");
}

TEST(ParseRequestTest, Optional) {
  Request req;
  ASSERT_EQ(ParseRequest(R"({"sandbox": "python", "command": "run"})", req).kind, ErrorKind::NONE);
  EXPECT_EQ(req.version, "");
  EXPECT_TRUE(req.files.empty());
}

TEST(ParseRequestTest, NullFields) {
  Request req;
  ExecError err = ParseRequest(R"js({
    "sandbox": "python", "command": "run", "version": null, "files": {"": "print(1)"}
  })js", req);
  ASSERT_EQ(err.kind, ErrorKind::NONE) << err.message;
  EXPECT_EQ(req.version, "");
  EXPECT_EQ(req.files.size(), 1u);
  Request empty;
  ASSERT_EQ(ParseRequest(R"({"sandbox": null, "command": null, "files": null})", empty).kind,
            ErrorKind::NONE);
  EXPECT_EQ(empty.sandbox, "");
  EXPECT_EQ(empty.command, "");
}

TEST(ParseRequestTest, Invalid) {
  Request req;
  EXPECT_EQ(ParseRequest("{", req).kind, ErrorKind::ARGUMENT);
  EXPECT_EQ(ParseRequest("[1]", req).kind, ErrorKind::ARGUMENT);
  EXPECT_EQ(ParseRequest(R"({"sandbox": 1})", req).kind, ErrorKind::ARGUMENT);
  EXPECT_EQ(ParseRequest(R"({"files": ["a"]})", req).kind, ErrorKind::ARGUMENT);
  EXPECT_EQ(ParseRequest(R"({"files": {"a": 1}})", req).kind, ErrorKind::ARGUMENT);
}

TEST(DumpExecutionTest, Success) {
  Execution exec = Success("python_run_1", "hello", "");
  exec.duration_ms = 42;
  json obj = json::parse(DumpExecution(exec));
  EXPECT_EQ(obj["id"], "python_run_1");
  EXPECT_EQ(obj["ok"], true);
  EXPECT_EQ(obj["duration"], 42);
  EXPECT_EQ(obj["stdout"], "hello");
  EXPECT_EQ(obj["stderr"], "");
  EXPECT_FALSE(obj.contains("error"));
}

TEST(DumpExecutionTest, Error) {
  Execution exec = Fail("python_run_1", ExecError(ErrorKind::TIMEOUT, kTimeoutMessage));
  json obj = json::parse(DumpExecution(exec));
  EXPECT_EQ(obj["ok"], false);
  EXPECT_EQ(obj["error"]["kind"], "timeout");
  EXPECT_EQ(obj["error"]["message"], "code execution timeout");
}

TEST(DumpExecutionTest, InvalidUtf8) {
  Execution exec = Success("python_run_1", "\xff\xfe", "");
  json obj = json::parse(DumpExecution(exec));
  EXPECT_TRUE(obj["stdout"].is_string());
}

TEST(ErrorKindTest, Names) {
  EXPECT_STREQ(ErrorKindName(ErrorKind::CODE), "code");
  EXPECT_TRUE(IsInfrastructureError(ErrorKind::EXECUTION));
  EXPECT_TRUE(IsInfrastructureError(ErrorKind::CONFIG));
  EXPECT_FALSE(IsInfrastructureError(ErrorKind::CODE));
  EXPECT_FALSE(IsInfrastructureError(ErrorKind::TIMEOUT));
}

class HandleExecTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    cfg = ExampleConfig();
    runner = std::make_shared<FakeRunner>();
    opt.box_root = temp_dir;
    opt.runner = runner;
    opt.spawn = SyncSpawner();
  }

  Config cfg;
  std::shared_ptr<FakeRunner> runner;
  EngineOptions opt;
};

const char kRequest[] = R"js({"sandbox": "python", "command": "run", "files": {"": "print(1)"}})js";

TEST_F(HandleExecTest, Ok) {
  runner->On("main.py", OkResult("1"));
  int status = 0;
  json obj = json::parse(HandleExec(cfg, opt, kRequest, status));
  EXPECT_EQ(status, 200);
  EXPECT_EQ(obj["ok"], true);
  EXPECT_EQ(obj["stdout"], "1");
}

TEST_F(HandleExecTest, CodeFailureIsOk) {
  runner->On("main.py", ExitedResult(1, "", "boom"));
  int status = 0;
  json obj = json::parse(HandleExec(cfg, opt, kRequest, status));
  EXPECT_EQ(status, 200);
  EXPECT_EQ(obj["ok"], false);
  EXPECT_EQ(obj["error"]["kind"], "code");
}

TEST_F(HandleExecTest, BadRequest) {
  int status = 0;
  HandleExec(cfg, opt, "not json", status);
  EXPECT_EQ(status, 400);
  HandleExec(cfg, opt, R"({"sandbox": "ruby", "command": "run", "files": {"": ""}})", status);
  EXPECT_EQ(status, 400);
  EXPECT_TRUE(runner->Calls().empty());
}

TEST_F(HandleExecTest, InfrastructureFailure) {
  runner->On("main.py", FailedResult("exec docker: No such file or directory"));
  int status = 0;
  json obj = json::parse(HandleExec(cfg, opt, kRequest, status));
  EXPECT_EQ(status, 500);
  EXPECT_EQ(obj["error"]["kind"], "execution");
}

} // namespace
