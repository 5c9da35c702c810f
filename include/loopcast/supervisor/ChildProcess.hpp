// Repository: loopcast
// Component: Child Process
// Purpose: Launch and control of the external transcoder process.
//          Production: PosixProcessLauncher (fork/execvp). Tests: a scripted
//          fake launcher.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SUPERVISOR_CHILD_PROCESS_HPP_
#define LOOPCAST_SUPERVISOR_CHILD_PROCESS_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace loopcast::supervisor {

struct ExitStatus {
  int exit_code = -1;   // Valid when term_signal == 0.
  int term_signal = 0;  // Non-zero when the child died from a signal.

  bool Clean() const { return term_signal == 0 && exit_code == 0; }
  std::string Describe() const;
};

// A running child. Terminate()/Kill() are safe from any thread and become
// no-ops once the child has been reaped, so a recycled pid is never signalled.
class IChildProcess {
 public:
  virtual ~IChildProcess() = default;

  virtual int Pid() const = 0;

  // Blocks reading the child's stderr until EOF. Lines are split on '\n' and
  // '\r' (ffmpeg rewrites its stats line with '\r').
  virtual void ReadDiagnostics(const std::function<void(const std::string&)>& on_line) = 0;

  // Blocks until the child exits and reaps it.
  virtual ExitStatus Wait() = 0;

  // SIGTERM to the child's process group.
  virtual void Terminate() = 0;
  // SIGKILL to the child's process group.
  virtual void Kill() = 0;
};

class IProcessLauncher {
 public:
  virtual ~IProcessLauncher() = default;

  // argv[0] is resolved through PATH. Throws std::system_error when the child
  // cannot be created or the program cannot be executed.
  virtual std::unique_ptr<IChildProcess> Launch(const std::vector<std::string>& argv) = 0;
};

// fork/execvp launcher. Each child:
// - runs in its own process group (signals reach ffmpeg's helpers too),
// - gets PR_SET_PDEATHSIG(SIGKILL) so it never outlives the forking thread,
// - has stdin on /dev/null and stderr on a pipe read by ReadDiagnostics().
// An exec failure is reported back over a close-on-exec pipe and thrown from
// Launch() instead of surfacing later as exit code 127.
class PosixProcessLauncher : public IProcessLauncher {
 public:
  std::unique_ptr<IChildProcess> Launch(const std::vector<std::string>& argv) override;
};

class PosixChildProcess : public IChildProcess {
 public:
  PosixChildProcess(int pid, int stderr_fd);
  ~PosixChildProcess() override;

  PosixChildProcess(const PosixChildProcess&) = delete;
  PosixChildProcess& operator=(const PosixChildProcess&) = delete;

  int Pid() const override { return pid_; }
  void ReadDiagnostics(const std::function<void(const std::string&)>& on_line) override;
  ExitStatus Wait() override;
  void Terminate() override;
  void Kill() override;

 private:
  void SignalGroup(int signo);

  const int pid_;
  int stderr_fd_;

  std::mutex mutex_;
  bool reaped_ = false;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_CHILD_PROCESS_HPP_
