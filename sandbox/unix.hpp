#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <chrono>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox based on fork and setrlimit. The program runs in its own session
// and process group, with an empty environment and no descriptor other than
// its standard streams. Network isolation needs unprivileged user namespaces.
class Unix : public Sandbox {
 public:
  bool Start(const ExecutionOptions& options, std::string* error_msg) override;
  bool Wait(ExecutionInfo* info, std::string* error_msg) override;
  void Kill() override;

  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 private:
  Unix() = default;

  // Everything the child needs is prepared here, since after fork the child
  // may not allocate memory.
  bool Prepare(std::string* error_msg);

  // Runs in the child process. Failures are written on the report pipe.
  [[noreturn]] void RunChild();
  [[noreturn]] void ChildFailed(const char* what, int err);

  // Reads a startup failure reported by the child, if any.
  bool ChildStarted(std::string* error_msg);

  const ExecutionOptions* options_ = nullptr;
  int report_pipe_[2] = {-1, -1};
  int child_pid_ = 0;

  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  int max_fd_ = 0;

  std::chrono::steady_clock::time_point start_time_;
  absl::Mutex state_mutex_;
  bool exited_ GUARDED_BY(state_mutex_) = false;
  bool killed_ GUARDED_BY(state_mutex_) = false;
};

}  // namespace sandbox
#endif
