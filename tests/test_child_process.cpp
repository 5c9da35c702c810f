// Repository: loopcast
// Component: POSIX child process unit tests (real /bin/sh children)

#include <gtest/gtest.h>

#include <signal.h>

#include <chrono>
#include <future>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "loopcast/supervisor/ChildProcess.hpp"

namespace loopcast::supervisor {
namespace {

std::unique_ptr<IChildProcess> Shell(PosixProcessLauncher& launcher, const std::string& script) {
  return launcher.Launch({"/bin/sh", "-c", script});
}

TEST(ChildProcessTest, ReportsExitCode) {
  PosixProcessLauncher launcher;
  auto child = Shell(launcher, "exit 3");
  EXPECT_GT(child->Pid(), 0);

  const ExitStatus status = child->Wait();
  EXPECT_EQ(status.exit_code, 3);
  EXPECT_EQ(status.term_signal, 0);
  EXPECT_FALSE(status.Clean());
  EXPECT_EQ(status.Describe(), "exit code 3");
}

TEST(ChildProcessTest, CleanExit) {
  PosixProcessLauncher launcher;
  auto child = Shell(launcher, "true");
  EXPECT_TRUE(child->Wait().Clean());
}

TEST(ChildProcessTest, MissingProgramThrowsFromLaunch) {
  PosixProcessLauncher launcher;
  try {
    launcher.Launch({"/nonexistent/loopcast-transcoder"});
    FAIL() << "expected std::system_error";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), ENOENT);
  }
  EXPECT_THROW(launcher.Launch({}), std::system_error);
}

TEST(ChildProcessTest, SplitsDiagnosticsOnNewlineAndCarriageReturn) {
  PosixProcessLauncher launcher;
  auto child = Shell(launcher, "printf 'one\\ntwo\\rthree' >&2");

  std::vector<std::string> lines;
  child->ReadDiagnostics([&](const std::string& line) { lines.push_back(line); });
  child->Wait();

  EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(ChildProcessTest, TerminateStopsCooperativeChild) {
  PosixProcessLauncher launcher;
  auto child = Shell(launcher, "sleep 30");

  child->Terminate();
  const ExitStatus status = child->Wait();
  EXPECT_EQ(status.term_signal, SIGTERM);
  EXPECT_NE(status.Describe().find("signal 15"), std::string::npos);

  // Signalling a reaped child is a no-op.
  child->Terminate();
  child->Kill();
}

TEST(ChildProcessTest, KillStopsChildThatIgnoresTerminate) {
  PosixProcessLauncher launcher;
  auto child = Shell(launcher, "trap '' TERM; echo ready >&2; sleep 30");

  std::promise<void> ready;
  std::thread reader([&] {
    bool announced = false;
    child->ReadDiagnostics([&](const std::string& line) {
      if (!announced && line == "ready") {
        announced = true;
        ready.set_value();
      }
    });
  });
  ASSERT_EQ(ready.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

  child->Terminate();
  auto exited = std::async(std::launch::async, [&] { return child->Wait(); });
  EXPECT_EQ(exited.wait_for(std::chrono::milliseconds(300)), std::future_status::timeout);

  child->Kill();
  ASSERT_EQ(exited.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(exited.get().term_signal, SIGKILL);
  reader.join();
}

TEST(ChildProcessTest, DestructorKillsRunningChild) {
  PosixProcessLauncher launcher;
  int pid = 0;
  {
    auto child = Shell(launcher, "sleep 30");
    pid = child->Pid();
  }
  // Reaped by the destructor: the pid no longer names our child.
  EXPECT_NE(::kill(pid, 0), 0);
}

}  // namespace
}  // namespace loopcast::supervisor
