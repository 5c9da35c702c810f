// Repository: loopcast
// Component: Child Process
// Purpose: fork/execvp launcher with process-group signalling.
// Copyright (c) 2026 Loopcast

#include "loopcast/supervisor/ChildProcess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "loopcast/util/Logger.hpp"

namespace loopcast::supervisor {

using util::Logger;

std::string ExitStatus::Describe() const {
  if (term_signal != 0) {
    const char* name = strsignal(term_signal);
    return "killed by signal " + std::to_string(term_signal) + (name ? std::string(" (") + name + ")" : "");
  }
  return "exit code " + std::to_string(exit_code);
}

namespace {

void CloseQuietly(int fd) {
  if (fd >= 0) ::close(fd);
}

ExitStatus FromWaitStatus(int status) {
  ExitStatus result;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

// Runs in the forked child: async-signal-safe calls only.
[[noreturn]] void ExecChild(char* const* argv, pid_t parent, int stderr_fd, int report_fd) {
  ::setpgid(0, 0);
  ::prctl(PR_SET_PDEATHSIG, SIGKILL);
  if (::getppid() != parent) _exit(127);

  // The parent ignores SIGPIPE; ignored dispositions survive exec.
  ::signal(SIGPIPE, SIG_DFL);

  const int devnull = ::open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    ::dup2(devnull, STDIN_FILENO);
    ::close(devnull);
  }
  ::dup2(stderr_fd, STDERR_FILENO);
  ::close(stderr_fd);

  ::execvp(argv[0], argv);

  const int err = errno;
  ssize_t ignored = ::write(report_fd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

}  // namespace

std::unique_ptr<IChildProcess> PosixProcessLauncher::Launch(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw std::system_error(EINVAL, std::generic_category(), "empty command line");
  }

  // Built before fork: the child may not allocate.
  std::vector<char*> c_args;
  c_args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_args.push_back(const_cast<char*>(arg.c_str()));
  }
  c_args.push_back(nullptr);

  int err_pipe[2];
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  int report_pipe[2];
  if (::pipe2(report_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    CloseQuietly(err_pipe[0]);
    CloseQuietly(err_pipe[1]);
    throw std::system_error(err, std::generic_category(), "pipe");
  }

  const pid_t parent = ::getpid();
  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    CloseQuietly(err_pipe[0]);
    CloseQuietly(err_pipe[1]);
    CloseQuietly(report_pipe[0]);
    CloseQuietly(report_pipe[1]);
    throw std::system_error(err, std::generic_category(), "fork");
  }
  if (pid == 0) {
    ::close(err_pipe[0]);
    ::close(report_pipe[0]);
    ExecChild(c_args.data(), parent, err_pipe[1], report_pipe[1]);
  }

  // Both sides call setpgid so the group exists before the first signal.
  ::setpgid(pid, pid);
  ::close(err_pipe[1]);
  ::close(report_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(report_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  ::close(report_pipe[0]);

  if (n > 0) {
    // exec failed; the child has already exited.
    CloseQuietly(err_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw std::system_error(exec_errno, std::generic_category(), "exec " + argv[0]);
  }

  Logger::Debug("[ChildProcess] started pid " + std::to_string(pid) + ": " + argv[0]);
  return std::make_unique<PosixChildProcess>(pid, err_pipe[0]);
}

PosixChildProcess::PosixChildProcess(int pid, int stderr_fd) : pid_(pid), stderr_fd_(stderr_fd) {}

PosixChildProcess::~PosixChildProcess() {
  bool reaped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reaped = reaped_;
  }
  if (!reaped) {
    SignalGroup(SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }
  CloseQuietly(stderr_fd_);
}

void PosixChildProcess::ReadDiagnostics(const std::function<void(const std::string&)>& on_line) {
  if (stderr_fd_ < 0) return;

  std::string pending;
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      Logger::Warn("[ChildProcess] stderr read failed: " + std::string(std::strerror(errno)));
      break;
    }
    if (n == 0) break;
    for (ssize_t i = 0; i < n; ++i) {
      const char c = buf[i];
      if (c == '\n' || c == '\r') {
        if (!pending.empty()) {
          on_line(pending);
          pending.clear();
        }
      } else {
        pending.push_back(c);
      }
    }
  }
  if (!pending.empty()) on_line(pending);

  ::close(stderr_fd_);
  stderr_fd_ = -1;
}

ExitStatus PosixChildProcess::Wait() {
  // Wait without reaping, then reap under the lock: Terminate()/Kill() never
  // race a reap and signal a reused pid.
  siginfo_t info;
  std::memset(&info, 0, sizeof(info));
  while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
    if (errno != EINTR) break;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (reaped_) return ExitStatus{};
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while (r < 0 && errno == EINTR);
  reaped_ = true;
  if (r < 0) {
    Logger::Warn("[ChildProcess] waitpid(" + std::to_string(pid_) + ") failed: " +
                 std::strerror(errno));
    return ExitStatus{};
  }
  return FromWaitStatus(status);
}

void PosixChildProcess::Terminate() { SignalGroup(SIGTERM); }

void PosixChildProcess::Kill() { SignalGroup(SIGKILL); }

void PosixChildProcess::SignalGroup(int signo) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reaped_) return;
  if (::kill(-pid_, signo) != 0 && errno == ESRCH) {
    ::kill(pid_, signo);
  }
}

}  // namespace loopcast::supervisor
