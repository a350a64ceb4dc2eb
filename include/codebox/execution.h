#ifndef INCLUDE_CODEBOX_EXECUTION_H_
#define INCLUDE_CODEBOX_EXECUTION_H_

#include <string>
#include <vector>
#include <utility>
#include <initializer_list>

#define ENUM_ERROR_KIND_ \
  X(NONE, "") \
  X(ARGUMENT, "argument") /* malformed request */ \
  X(CONFIG, "config") /* request does not match the box configuration */ \
  X(EXECUTION, "execution") /* the sandbox machinery failed */ \
  X(TIMEOUT, "timeout") \
  X(CODE, "code") /* the program under test failed */
enum class ErrorKind {
#define X(name, str) name,
  ENUM_ERROR_KIND_
#undef X
};

struct ExecError {
  ErrorKind kind;
  std::string message;

  ExecError() : kind(ErrorKind::NONE) {}
  ExecError(ErrorKind kind, std::string message) :
      kind(kind), message(std::move(message)) {}
};

// An ordered name -> content collection. At most one file may have an empty name;
//   it stands for the entry point of the command and is renamed when staged.
class Files {
 public:
  using Item = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Item>::const_iterator;

  Files() {}
  // later items with a duplicate name are dropped
  Files(std::initializer_list<Item> items);

  // return false if the name already exists
  bool Add(std::string name, std::string content);

  const std::string* Find(const std::string& name) const;
  // contents concatenated in order; used as stdin of the sandbox
  std::string Concat() const;

  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const_iterator begin() const { return items_.begin(); }
  const_iterator end() const { return items_.end(); }
 private:
  std::vector<Item> items_;
};

struct Request {
  // also the name of the container; must be unique among running executions
  std::string id;
  std::string sandbox;
  std::string command;
  std::string version; // empty for the box default
  Files files;
};

struct Execution {
  std::string id;
  bool ok;
  long duration_ms;
  // filled on success, or when the program under test failed (kind == CODE)
  std::string stdout_str, stderr_str;
  ExecError error;

  Execution() : ok(false), duration_ms(0) {}
};

Execution Success(const std::string& id, std::string stdout_str, std::string stderr_str);
Execution Fail(const std::string& id, ExecError err);
// infrastructure failure at the given stage
Execution FailStage(const std::string& id, const std::string& stage, const std::string& detail);

const char* ErrorKindName(ErrorKind);
bool IsInfrastructureError(ErrorKind);

extern const char kTimeoutMessage[];

#endif  // INCLUDE_CODEBOX_EXECUTION_H_
