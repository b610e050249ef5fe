#ifndef EXECUTOR_SANDBOX_EXECUTOR_HPP
#define EXECUTOR_SANDBOX_EXECUTOR_HPP

#include "executor/executor.hpp"

namespace executor {

// Runs every request in a fresh single-use sandbox: a new temporary
// directory, a new runtime process and new pipes. Nothing is shared between
// two calls.
class SandboxExecutor : public Executor {
 public:
  std::string Id() const override { return id_; }
  ExecutionResult Execute(const proto::Submission& submission,
                          const proto::TestBattery& battery,
                          absl::Duration time_budget) override;

  // runtime_path is looked up in PATH when it contains no slash.
  SandboxExecutor(std::string id, std::string runtime_path,
                  std::string temp_directory, ExecutionLimits limits);
  SandboxExecutor(const SandboxExecutor&) = delete;
  SandboxExecutor& operator=(const SandboxExecutor&) = delete;
  SandboxExecutor(SandboxExecutor&&) = delete;
  SandboxExecutor& operator=(SandboxExecutor&&) = delete;
  ~SandboxExecutor() override = default;

 private:
  static const constexpr char* kBoxDir = "box";

  std::string RuntimePath() const;

  std::string id_;
  std::string runtime_path_;
  std::string temp_directory_;
  ExecutionLimits limits_;
};

}  // namespace executor

#endif
