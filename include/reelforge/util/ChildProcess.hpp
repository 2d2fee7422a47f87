// Repository: ReelForge
// Component: Child Process
// Purpose: fork/exec wrapper with stdio pipes and process-group teardown.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_UTIL_CHILD_PROCESS_HPP_
#define REELFORGE_UTIL_CHILD_PROCESS_HPP_

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace reelforge::util {

struct ExitStatus {
  bool exited = false;    // normal exit; `code` valid
  int code = -1;
  bool signaled = false;  // killed by signal; `signal` valid
  int signal = 0;

  bool Succeeded() const { return exited && code == 0; }
  std::string Describe() const;
};

struct SpawnOptions {
  std::vector<std::string> argv;  // argv[0] is resolved through PATH
  bool new_process_group = true;  // child becomes leader of its own group
  bool pipe_stdin = true;
  bool pipe_stdout = true;
  bool pipe_stderr = true;
};

// ChildProcess owns one forked child and the parent ends of its pipes.
//
// Teardown rule: a ChildProcess is never destroyed with an unreaped child.
// The destructor kills the child's process group (when it leads one) and
// waits for it. LiveCount() reports children spawned and not yet reaped
// across the whole process.
class ChildProcess {
 public:
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // Returns nullptr and fills `error` when fork or exec fails.
  static std::unique_ptr<ChildProcess> Spawn(const SpawnOptions& options,
                                             std::string* error);

  pid_t pid() const { return pid_; }
  int stdin_fd() const { return stdin_fd_; }
  int stdout_fd() const { return stdout_fd_; }
  int stderr_fd() const { return stderr_fd_; }

  void CloseStdin();

  // Non-blocking reap. Returns true once the child has exited.
  bool TryWait(ExitStatus* status);

  // Blocking reap.
  ExitStatus Wait();

  // Sends `sig` to the whole group (or the child alone if it does not
  // lead a group). No-op once reaped.
  void Kill(int sig);

  // SIGKILL the group and reap. Safe to call repeatedly.
  ExitStatus Terminate();

  bool IsReaped() const { return reaped_; }

  static int LiveCount();

 private:
  ChildProcess() = default;

  void MarkReaped(int raw_status);
  void ClosePipes();

  pid_t pid_ = -1;
  bool group_leader_ = false;
  bool reaped_ = false;
  ExitStatus status_;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;

  static std::atomic<int> live_count_;
};

// Reads whatever is currently available on a non-blocking fd into `out`.
// Returns false when the peer closed the pipe (EOF) or on a hard error.
bool DrainFd(int fd, std::string* out);

// Keeps the last `limit` bytes of a stream in `tail`.
inline constexpr size_t kDiagnosticTailBytes = 8192;
void AppendTail(std::string* tail, const std::string& chunk,
                size_t limit = kDiagnosticTailBytes);

// Returns true when `path` names an executable file, directly or via PATH.
bool IsExecutableOnPath(const std::string& path);

}  // namespace reelforge::util

#endif  // REELFORGE_UTIL_CHILD_PROCESS_HPP_
