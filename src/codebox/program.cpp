#include <codebox/program.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <algorithm>
#include <cstring>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

using Clock = std::chrono::steady_clock;

struct Pipe {
  int fd[2] = {-1, -1};
  bool Open() { return pipe2(fd, O_CLOEXEC) == 0; }
  void Close(int i) {
    if (fd[i] >= 0) close(fd[i]);
    fd[i] = -1;
  }
  ~Pipe() { Close(0), Close(1); }
};

// Block SIGPIPE in the calling thread so that writing to an exited child fails with EPIPE
class ScopedBlockSigpipe {
  sigset_t set_, old_;
  bool blocked_;
 public:
  ScopedBlockSigpipe() {
    sigemptyset(&set_);
    sigaddset(&set_, SIGPIPE);
    blocked_ = pthread_sigmask(SIG_BLOCK, &set_, &old_) == 0 && !sigismember(&old_, SIGPIPE);
  }
  ~ScopedBlockSigpipe() {
    if (!blocked_) return;
    // discard the SIGPIPE we caused, if any
    struct timespec zero = {};
    while (sigtimedwait(&set_, nullptr, &zero) > 0);
    pthread_sigmask(SIG_SETMASK, &old_, nullptr);
  }
};

inline std::string Trim(const std::string& str) {
  const char* kSpace = " \t\n\r\f\v";
  size_t begin = str.find_first_not_of(kSpace);
  if (begin == std::string::npos) return "";
  size_t end = str.find_last_not_of(kSpace);
  return str.substr(begin, end - begin + 1);
}

inline long RemainingMs(Clock::time_point deadline) {
  auto rem = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return rem < 0 ? 0 : rem;
}

// Read what is available; return false on EOF or error
bool ReadInto(int fd, std::string& out, size_t limit) {
  char buf[65536];
  ssize_t n = read(fd, buf, sizeof(buf));
  if (n < 0) return errno == EINTR || errno == EAGAIN;
  if (n == 0) return false;
  if (out.size() < limit) out.append(buf, std::min((size_t)n, limit - out.size()));
  return true;
}

} // namespace

ProgramResult ForkProgramRunner::Run(const ProgramOptions& opt) const {
  ProgramResult res;
  Pipe in, out, err, exec_err;
  if (!in.Open() || !out.Open() || !err.Open() || !exec_err.Open()) {
    res.detail = fmt::format("create pipes: {}", strerror(errno));
    return res;
  }
  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(opt.name.c_str()));
  for (auto& i : opt.args) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);

  spdlog::debug("{}: exec {} {}", opt.id, opt.name, fmt::format("{}", opt.args));
  pid_t pid = fork();
  if (pid < 0) {
    res.detail = fmt::format("fork: {}", strerror(errno));
    return res;
  }
  if (pid == 0) {
    // only async-signal-safe calls from here on
    setpgid(0, 0);
    if (dup2(in.fd[0], 0) < 0 || dup2(out.fd[1], 1) < 0 || dup2(err.fd[1], 2) < 0) _exit(127);
    execvp(argv[0], argv.data());
    int e = errno;
    if (write(exec_err.fd[1], &e, sizeof(e)) < 0) _exit(127);
    _exit(127);
  }
  setpgid(pid, pid); // either this or the child's call wins
  in.Close(0), out.Close(1), err.Close(1), exec_err.Close(1);

  int exec_errno = 0;
  ssize_t n;
  while ((n = read(exec_err.fd[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
  if (n == sizeof(exec_errno)) {
    waitpid(pid, nullptr, 0);
    res.detail = fmt::format("exec {}: {}", opt.name, strerror(exec_errno));
    return res;
  }

  ScopedBlockSigpipe block_sigpipe;
  auto deadline = Clock::now() + std::chrono::milliseconds(opt.timeout_ms);
  size_t limit = opt.max_output > 0 ? opt.max_output : 0;
  size_t written = 0;
  if (opt.has_input && !opt.input.empty()) {
    fcntl(in.fd[1], F_SETFL, fcntl(in.fd[1], F_GETFL) | O_NONBLOCK);
  } else {
    in.Close(1);
  }
  std::string stdout_buf, stderr_buf;
  bool timed_out = false;
  while (out.fd[0] >= 0 || err.fd[0] >= 0) {
    if (opt.timeout_ms > 0 && RemainingMs(deadline) == 0) {
      timed_out = true;
      break;
    }
    struct pollfd fds[3];
    int* owners[3];
    int nfds = 0;
    for (int* fd : {&in.fd[1], &out.fd[0], &err.fd[0]}) {
      if (*fd < 0) continue;
      fds[nfds].fd = *fd;
      fds[nfds].events = fd == &in.fd[1] ? POLLOUT : POLLIN;
      fds[nfds].revents = 0;
      owners[nfds++] = fd;
    }
    int timeout = opt.timeout_ms > 0 ? (int)RemainingMs(deadline) : -1;
    int ready = poll(fds, nfds, timeout);
    if (ready < 0 && errno != EINTR) {
      res.detail = fmt::format("poll: {}", strerror(errno));
      kill(-pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      return res;
    }
    for (int i = 0; i < nfds && ready > 0; i++) {
      if (!fds[i].revents) continue;
      if (owners[i] == &in.fd[1]) {
        ssize_t w = write(in.fd[1], opt.input.data() + written, opt.input.size() - written);
        if (w > 0) written += w;
        if ((w < 0 && errno != EAGAIN && errno != EINTR) || written == opt.input.size()) {
          in.Close(1); // EOF for the child; EPIPE means it does not read stdin
        }
      } else {
        std::string& buf = owners[i] == &out.fd[0] ? stdout_buf : stderr_buf;
        if (!ReadInto(*owners[i], buf, limit)) {
          close(*owners[i]);
          *owners[i] = -1;
        }
      }
    }
  }
  in.Close(1);

  int status = 0;
  while (!timed_out) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) break;
    if (ret < 0 && errno != EINTR) {
      res.detail = fmt::format("waitpid: {}", strerror(errno));
      return res;
    }
    // the streams are closed but the process is still running
    if (opt.timeout_ms > 0 && RemainingMs(deadline) == 0) {
      timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  if (timed_out) {
    kill(-pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    spdlog::debug("{}: execution timeout, killed process={}", opt.id, pid);
    res.status = ProgramStatus::TIMEOUT;
    res.detail = "signal: killed";
    return res;
  }

  res.stdout_str = Trim(stdout_buf);
  res.stderr_str = Trim(stderr_buf);
  if (WIFEXITED(status)) {
    res.exit_code = WEXITSTATUS(status);
    if (res.exit_code == 0) {
      res.status = ProgramStatus::OK;
    } else {
      res.status = ProgramStatus::EXITED;
      res.detail = fmt::format("exit status {}", res.exit_code);
    }
  } else {
    res.status = ProgramStatus::EXITED;
    res.detail = fmt::format("signal: {}", strsignal(WTERMSIG(status)));
  }
  return res;
}

#define X(name) case ProgramStatus::name: return #name;
const char* ProgramStatusName(ProgramStatus status) {
  switch (status) {
    ENUM_PROGRAM_STATUS_
  }
  __builtin_unreachable();
}
#undef X
