#include "sandbox/unix.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <sched.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace sandbox {
namespace {

constexpr size_t kErrorBufSize = 512;

// Upper bound on the descriptors closed in the child.
constexpr int kMaxClosedFd = 64 * 1024;

// execve may fail with ETXTBSY while another thread still holds the binary
// open for writing.
constexpr int kExecAttempts = 16;

char* kEmptyEnvironment[] = {nullptr};

// Works with both the GNU and the XSI strerror_r.
const char* ErrorString(char* (*gnu)(int, char*, size_t), int err, char* buf,
                        size_t size) {
  return gnu(err, buf, size);
}
const char* ErrorString(int (*xsi)(int, char*, size_t), int err, char* buf,
                        size_t size) {
  if (xsi(err, buf, size) != 0) snprintf(buf, size, "error %d", err);
  return buf;
}

std::string Describe(const char* what, int err) {
  char buf[kErrorBufSize] = {};
  std::string msg = what;
  msg += ": ";
  msg += ErrorString(&strerror_r, err, buf, sizeof(buf));
  return msg;
}

// Returns false if the limit could not be applied. A zero value leaves the
// inherited limit alone unless force is set.
bool Limit(int resource, rlim_t value, bool force) {
  if (value == 0 && !force) return true;
  struct rlimit rlim;
  rlim.rlim_cur = value;
  rlim.rlim_max = value;
  return setrlimit(resource, &rlim) == 0;
}

}  // namespace

bool Unix::Start(const ExecutionOptions& options, std::string* error_msg) {
  CHECK(options_ == nullptr) << "Start called twice on the same sandbox";
  options_ = &options;
  if (!Prepare(error_msg)) return false;
  start_time_ = std::chrono::steady_clock::now();
  int pid = fork();
  if (pid == -1) {
    *error_msg = Describe("fork", errno);
    close(report_pipe_[0]);
    close(report_pipe_[1]);
    return false;
  }
  if (pid == 0) RunChild();
  child_pid_ = pid;
  close(report_pipe_[1]);
  bool started = ChildStarted(error_msg);
  close(report_pipe_[0]);
  if (started) return true;
  // The child already exited, reap it.
  int status = 0;
  while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
  }
  absl::MutexLock lock(&state_mutex_);
  exited_ = true;
  return false;
}

bool Unix::Prepare(std::string* error_msg) {
  if (pipe2(report_pipe_, O_CLOEXEC) == -1) {
    *error_msg = Describe("pipe2", errno);
    return false;
  }
  arg_storage_.clear();
  arg_storage_.reserve(options_->args.size() + 1);
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back('\0');
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  argv_.clear();
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);
  long open_max = sysconf(_SC_OPEN_MAX);
  max_fd_ = open_max <= 0 || open_max > kMaxClosedFd
                ? kMaxClosedFd
                : static_cast<int>(open_max);
  return true;
}

bool Unix::ChildStarted(std::string* error_msg) {
  // The pipe is closed on exec, so EOF means the program is running.
  char buf[PIPE_BUF] = {};
  size_t len = 0;
  while (len + 1 < sizeof(buf)) {
    ssize_t n = read(report_pipe_[0], buf + len, sizeof(buf) - 1 - len);
    if (n == -1 && errno == EINTR) continue;
    if (n <= 0) break;
    len += n;
  }
  if (len == 0) return true;
  *error_msg = std::string(buf, len);
  return false;
}

void Unix::ChildFailed(const char* what, int err) {
  char message[PIPE_BUF] = {};
  char buf[kErrorBufSize] = {};
  snprintf(message, sizeof(message), "%s: %s", what,
           ErrorString(&strerror_r, err, buf, sizeof(buf)));
  // A single write below PIPE_BUF is atomic.
  if (write(report_pipe_[1], message, strlen(message)) < 0) _Exit(1);
  _Exit(1);
}

void Unix::RunChild() {
  close(report_pipe_[0]);

  // Own session and process group: Kill reaches every descendant, and the
  // terminal's signals do not reach the program.
  if (setsid() == -1) ChildFailed("setsid", errno);

  if (options_->isolate_network &&
      unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1) {
    ChildFailed("unshare", errno);
  }

  struct {
    int source;
    int target;
    const char* name;
  } redirects[] = {
      {options_->stdin_fd, STDIN_FILENO, "redirect stdin"},
      {options_->stdout_fd, STDOUT_FILENO, "redirect stdout"},
      {options_->stderr_fd, STDERR_FILENO, "redirect stderr"},
  };
  for (const auto& r : redirects) {
    if (r.source < 0) {
      if (close(r.target) == -1 && errno != EBADF) ChildFailed(r.name, errno);
    } else if (r.source == r.target) {
      if (fcntl(r.target, F_SETFD, 0) == -1) ChildFailed(r.name, errno);
    } else if (dup2(r.source, r.target) == -1) {
      ChildFailed(r.name, errno);
    }
  }

  // Nothing else the host has open may leak into the program.
  for (int fd = STDERR_FILENO + 1; fd < max_fd_; fd++) {
    if (fd != report_pipe_[1]) close(fd);
  }

  if (chdir(options_->root.c_str()) == -1) ChildFailed("chdir", errno);

  // The CPU limit has a granularity of one second, rounded up.
  rlim_t cpu_seconds = (options_->cpu_limit_millis + 999) / 1000;
  rlim_t stack = options_->max_stack_kb ? options_->max_stack_kb * 1024
                                        : RLIM_INFINITY;
  if (!Limit(RLIMIT_AS, options_->memory_limit_kb * 1024, false)) {
    ChildFailed("setrlimit AS", errno);
  }
  if (!Limit(RLIMIT_CPU, cpu_seconds, false)) {
    ChildFailed("setrlimit CPU", errno);
  }
  if (!Limit(RLIMIT_NOFILE, options_->max_files, false)) {
    ChildFailed("setrlimit NOFILE", errno);
  }
  if (!Limit(RLIMIT_NPROC, options_->max_procs, false)) {
    ChildFailed("setrlimit NPROC", errno);
  }
  if (!Limit(RLIMIT_STACK, stack, false)) {
    ChildFailed("setrlimit STACK", errno);
  }
  if (!Limit(RLIMIT_FSIZE, options_->max_file_size_kb * 1024, true)) {
    ChildFailed("setrlimit FSIZE", errno);
  }
  if (!Limit(RLIMIT_CORE, 0, true)) ChildFailed("setrlimit CORE", errno);

  for (int attempt = 0; attempt < kExecAttempts; attempt++) {
    execve(options_->executable.c_str(), argv_.data(), kEmptyEnvironment);
    if (errno != ETXTBSY) break;
    usleep(100);
  }
  ChildFailed("exec", errno);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  // Wait without reaping first: until the zombie is collected its PID cannot
  // be reused, so a concurrent Kill never hits another process.
  siginfo_t siginfo;
  while (waitid(P_PID, child_pid_, &siginfo, WEXITED | WNOWAIT) == -1) {
    if (errno == EINTR) continue;
    *error_msg = Describe("waitid", errno);
    return false;
  }
  bool killed = false;
  {
    absl::MutexLock lock(&state_mutex_);
    exited_ = true;
    killed = killed_;
  }

  int status = 0;
  struct rusage usage;
  while (wait4(child_pid_, &status, 0, &usage) == -1) {
    if (errno == EINTR) continue;
    *error_msg = Describe("wait4", errno);
    return false;
  }
  auto millis = [](const struct timeval& tv) {
    return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
  };
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  info->wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start_time_)
          .count();
  info->cpu_time_millis = millis(usage.ru_utime);
  info->sys_time_millis = millis(usage.ru_stime);
  info->memory_usage_kb = usage.ru_maxrss;
  info->killed = killed || info->signal == SIGXCPU;
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
  return true;
}

void Unix::Kill() {
  absl::MutexLock lock(&state_mutex_);
  if (child_pid_ == 0 || exited_) return;
  killed_ = true;
  // The whole process group created by setsid, then the child itself in case
  // it did not get that far.
  for (int target : {-child_pid_, child_pid_}) {
    if (kill(target, SIGKILL) == -1 && errno != ESRCH) {
      PLOG(WARNING) << "kill " << target;
    }
  }
}

namespace {
Sandbox::Register<Unix> unix_sandbox("unix");
}  // namespace

}  // namespace sandbox
