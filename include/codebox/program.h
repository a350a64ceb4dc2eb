#ifndef INCLUDE_CODEBOX_PROGRAM_H_
#define INCLUDE_CODEBOX_PROGRAM_H_

#include <string>
#include <vector>

#define ENUM_PROGRAM_STATUS_ \
  X(OK) \
  X(TIMEOUT) /* killed because the deadline passed */ \
  X(EXITED) /* nonzero exit status or terminated by a signal */ \
  X(FAILED) /* could not run at all */
enum class ProgramStatus {
#define X(name) name,
  ENUM_PROGRAM_STATUS_
#undef X
};

struct ProgramOptions {
  std::string id; // for logging
  std::string name; // looked up in PATH
  std::vector<std::string> args;
  bool has_input;
  std::string input;
  long timeout_ms;
  long max_output; // bytes per stream; 0 for no output

  ProgramOptions() : has_input(false), timeout_ms(0), max_output(0) {}
};

struct ProgramResult {
  ProgramStatus status;
  int exit_code; // valid if status == EXITED and the program was not signaled
  // trimmed and truncated to max_output
  std::string stdout_str, stderr_str;
  // "exit status 1", "signal: Segmentation fault" or the reason of failure
  std::string detail;

  ProgramResult() : status(ProgramStatus::FAILED), exit_code(-1) {}
};

// Runs an external program with a deadline and bounded output.
// Implementations must be safe to call from multiple threads.
class ProgramRunner {
 public:
  virtual ~ProgramRunner() = default;
  virtual ProgramResult Run(const ProgramOptions&) const = 0;
};

class ForkProgramRunner : public ProgramRunner {
 public:
  ProgramResult Run(const ProgramOptions&) const override;
};

const char* ProgramStatusName(ProgramStatus);

#endif  // INCLUDE_CODEBOX_PROGRAM_H_
