#include <codebox/execution.h>

const char kTimeoutMessage[] = "code execution timeout";

Files::Files(std::initializer_list<Item> items) {
  for (auto& [name, content] : items) {
    if (Find(name)) continue;
    items_.emplace_back(name, content);
  }
}

bool Files::Add(std::string name, std::string content) {
  if (Find(name)) return false;
  items_.emplace_back(std::move(name), std::move(content));
  return true;
}

const std::string* Files::Find(const std::string& name) const {
  for (auto& [item_name, content] : items_) {
    if (item_name == name) return &content;
  }
  return nullptr;
}

std::string Files::Concat() const {
  std::string ret;
  for (auto& item : items_) ret += item.second;
  return ret;
}

Execution Success(const std::string& id, std::string stdout_str, std::string stderr_str) {
  Execution ret;
  ret.id = id;
  ret.ok = true;
  ret.stdout_str = std::move(stdout_str);
  ret.stderr_str = std::move(stderr_str);
  return ret;
}

Execution Fail(const std::string& id, ExecError err) {
  Execution ret;
  ret.id = id;
  ret.error = std::move(err);
  return ret;
}

Execution FailStage(const std::string& id, const std::string& stage, const std::string& detail) {
  return Fail(id, ExecError(ErrorKind::EXECUTION, detail.empty() ? stage : stage + ": " + detail));
}

static const char* kErrorKindTable[] = {
#define X(name, str) str,
  ENUM_ERROR_KIND_
#undef X
};

const char* ErrorKindName(ErrorKind kind) {
  return kErrorKindTable[(int)kind];
}

bool IsInfrastructureError(ErrorKind kind) {
  return kind == ErrorKind::CONFIG || kind == ErrorKind::EXECUTION;
}
