#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "proto/grading.pb.h"

namespace executor {

// The sandbox could not be run at all. This is an infrastructure failure and
// never a verdict on the submission.
class ExecutionError : public std::runtime_error {
 public:
  explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Resource limits applied to every sandbox. Zero means no limit.
struct ExecutionLimits {
  int64_t memory_kb = 0;
  int32_t max_files = 0;
  int32_t max_procs = 0;
  int64_t stack_kb = 0;
  bool isolate_network = false;

  // Limits configured by the --sandbox_* flags.
  static ExecutionLimits FromFlags();
};

struct ExecutionResult {
  // One outcome per test of the battery, in the same order.
  std::vector<proto::TestOutcome> outcomes;
  // Console output of the submission, in arrival order.
  std::vector<proto::LogEntry> logs;
  int64_t duration_ms = 0;
  proto::TerminationReason termination_reason =
      proto::TerminationReason::NORMAL;
  // Set for FAULT, TIMEOUT and CRASH terminations.
  std::string fault_message;
};

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs the submission and then the battery against it. Timeouts and faults
  // of the submission are reported in the result; ExecutionError is thrown
  // only if the execution could not take place. Safe to call concurrently.
  virtual ExecutionResult Execute(const proto::Submission& submission,
                                  const proto::TestBattery& battery,
                                  absl::Duration time_budget) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
