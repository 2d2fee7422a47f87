// Repository: ReelForge
// Component: Child Process
// Purpose: fork/exec wrapper with stdio pipes and process-group teardown.
// Copyright (c) 2025 ReelForge

#include "reelforge/util/ChildProcess.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "reelforge/util/Logger.hpp"

namespace reelforge::util {

std::atomic<int> ChildProcess::live_count_{0};

namespace {

void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Writing to a pipe whose reader died must surface as EPIPE, not kill us.
void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &sa, nullptr);
  });
}

}  // namespace

std::string ExitStatus::Describe() const {
  std::ostringstream oss;
  if (exited) {
    oss << "exit code " << code;
  } else if (signaled) {
    oss << "killed by signal " << signal;
  } else {
    oss << "unknown exit status";
  }
  return oss.str();
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const SpawnOptions& options,
                                                  std::string* error) {
  if (options.argv.empty()) {
    if (error) *error = "empty argv";
    return nullptr;
  }
  IgnoreSigpipeOnce();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};  // reports exec failure errno to the parent

  auto close_all = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };

  // Every end is close-on-exec so a sibling spawned later never holds
  // another child's stdin open. dup2 clears the flag on the child's stdio.
  if ((options.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) ||
      (options.pipe_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) ||
      (options.pipe_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) ||
      pipe2(exec_pipe, O_CLOEXEC) != 0) {
    if (error) *error = std::string("pipe failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  // argv must be built before fork; only async-signal-safe calls follow.
  std::vector<char*> argv;
  argv.reserve(options.argv.size() + 1);
  for (const auto& a : options.argv) {
    argv.push_back(const_cast<char*>(a.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    if (error) *error = std::string("fork failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    if (options.new_process_group) setpgid(0, 0);
    if (in_pipe[0] >= 0) dup2(in_pipe[0], STDIN_FILENO);
    if (out_pipe[1] >= 0) dup2(out_pipe[1], STDOUT_FILENO);
    if (err_pipe[1] >= 0) dup2(err_pipe[1], STDERR_FILENO);
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1],
                   err_pipe[0], err_pipe[1], exec_pipe[0]}) {
      if (fd > STDERR_FILENO) ::close(fd);
    }
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    sigaction(SIGPIPE, &sa, nullptr);
    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Also set from the parent so killpg works even if the child has not
  // been scheduled yet.
  if (options.new_process_group) setpgid(pid, pid);

  CloseFd(&exec_pipe[1]);
  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pid_ = pid;
  child->group_leader_ = options.new_process_group;
  child->stdin_fd_ = in_pipe[1];
  child->stdout_fd_ = out_pipe[0];
  child->stderr_fd_ = err_pipe[0];
  live_count_.fetch_add(1, std::memory_order_acq_rel);

  if (n > 0) {
    child->Wait();
    if (error) {
      *error = "exec " + options.argv[0] + " failed: " + std::strerror(child_errno);
    }
    return nullptr;
  }

  if (child->stdout_fd_ >= 0) SetNonBlocking(child->stdout_fd_);
  if (child->stderr_fd_ >= 0) SetNonBlocking(child->stderr_fd_);

  Logger::Debug("[ChildProcess] spawned pid=" + std::to_string(pid) + " " +
                options.argv[0]);
  return child;
}

ChildProcess::~ChildProcess() {
  if (!reaped_) {
    Terminate();
  }
  ClosePipes();
}

void ChildProcess::CloseStdin() {
  CloseFd(&stdin_fd_);
}

void ChildProcess::ClosePipes() {
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
}

void ChildProcess::MarkReaped(int raw_status) {
  reaped_ = true;
  if (WIFEXITED(raw_status)) {
    status_.exited = true;
    status_.code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    status_.signaled = true;
    status_.signal = WTERMSIG(raw_status);
  }
  live_count_.fetch_sub(1, std::memory_order_acq_rel);
}

bool ChildProcess::TryWait(ExitStatus* status) {
  if (!reaped_) {
    int raw = 0;
    pid_t r = waitpid(pid_, &raw, WNOHANG);
    if (r == pid_) {
      MarkReaped(raw);
    } else if (r < 0 && errno != EINTR) {
      // Someone else reaped it; treat as gone.
      reaped_ = true;
      live_count_.fetch_sub(1, std::memory_order_acq_rel);
    }
  }
  if (reaped_ && status) *status = status_;
  return reaped_;
}

ExitStatus ChildProcess::Wait() {
  while (!reaped_) {
    int raw = 0;
    pid_t r = waitpid(pid_, &raw, 0);
    if (r == pid_) {
      MarkReaped(raw);
    } else if (r < 0 && errno != EINTR) {
      reaped_ = true;
      live_count_.fetch_sub(1, std::memory_order_acq_rel);
    }
  }
  return status_;
}

void ChildProcess::Kill(int sig) {
  if (reaped_ || pid_ <= 0) return;
  if (group_leader_) {
    if (killpg(pid_, sig) == 0) return;
  }
  ::kill(pid_, sig);
}

ExitStatus ChildProcess::Terminate() {
  if (!reaped_) {
    Kill(SIGKILL);
    Wait();
    // Grandchildren in the group were killed too; nothing else to reap here.
    if (group_leader_) killpg(pid_, SIGKILL);
  }
  return status_;
}

int ChildProcess::LiveCount() {
  return live_count_.load(std::memory_order_acquire);
}

bool DrainFd(int fd, std::string* out) {
  if (fd < 0) return false;
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out->append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    return false;
  }
}

void AppendTail(std::string* tail, const std::string& chunk, size_t limit) {
  tail->append(chunk);
  if (tail->size() > limit) {
    tail->erase(0, tail->size() - limit);
  }
}

bool IsExecutableOnPath(const std::string& path) {
  if (path.empty()) return false;
  if (path.find('/') != std::string::npos) {
    return access(path.c_str(), X_OK) == 0;
  }
  const char* env_path = std::getenv("PATH");
  if (env_path == nullptr) return false;
  std::string dirs(env_path);
  size_t start = 0;
  while (start <= dirs.size()) {
    size_t end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();
    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + path;
    struct stat st;
    if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

}  // namespace reelforge::util
