#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// What to run and under which limits. A zero limit means the limit inherited
// from the caller.
struct ExecutionOptions {
  std::string root;
  std::string executable;
  std::vector<std::string> args;

  int64_t cpu_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int64_t max_stack_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  // Files, pipes excluded, cannot grow beyond this size. Zero forbids writing
  // to files at all.
  int64_t max_file_size_kb = 0;
  bool isolate_network = false;

  // Descriptors that become the standard streams of the program. A negative
  // value leaves the stream closed.
  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;

  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// How the program terminated and what it used.
struct ExecutionInfo {
  int32_t status_code = 0;
  // Zero unless the program was terminated by a signal.
  int32_t signal = 0;
  // Set when the sandbox killed the program, on request or at the CPU limit.
  bool killed = false;
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  std::string message;
};

// Runs a single program with the limits of an ExecutionOptions. Start may be
// called only once per object.
//
// Implementations register themselves with a global
// Sandbox::Register<Impl> object and provide two static functions:
// Impl::Create(), returning a new instance, and Impl::Score(), telling how
// suitable the implementation is on this machine. Create() picks the
// implementation with the highest positive score. Registration happens during
// static initialization, before any thread is started.
class Sandbox {
 public:
  static std::unique_ptr<Sandbox> Create();

  // Returns false and sets error_msg if the program could not be started.
  virtual bool Start(const ExecutionOptions& options,
                     std::string* error_msg) = 0;

  // Blocks until the program terminates and fills info. Returns false and
  // sets error_msg if the program could not be waited for.
  virtual bool Wait(ExecutionInfo* info, std::string* error_msg) = 0;

  // Kills the program and all of its descendants. Safe to call from another
  // thread while Wait is blocked, and after the program exited.
  virtual void Kill() = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    explicit Register(const char* name) {
      Sandbox::Add(Implementation{name, &T::Create, &T::Score});
    }
  };

 private:
  struct Implementation {
    const char* name;
    std::function<Sandbox*()> create;
    std::function<int()> score;
  };
  static std::vector<Implementation>* Implementations();
  static void Add(Implementation implementation);
};

}  // namespace sandbox

#endif
