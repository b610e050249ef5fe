#ifndef GRADING_REVALIDATION_HPP
#define GRADING_REVALIDATION_HPP

#include <functional>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "executor/executor.hpp"
#include "proto/grading.pb.h"

namespace grading {

// Largest score difference still considered an agreement.
static const constexpr double kScoreTolerance = 0.01;

struct RevalidationResult {
  bool accepted = false;
  // Generic reason for a rejection, safe to show to the caller.
  std::string reason;
  // The attempt computed by the fresh run, whatever the verdict.
  proto::Attempt server_attempt;
};

// Lists every way in which reported differs from expected: submission,
// status, score beyond kScoreTolerance, outcome count and per-test verdicts.
// An empty list means the two agree.
std::vector<std::string> CompareAttempts(const proto::Attempt& reported,
                                         const proto::Attempt& expected);

// Re-runs a submission on a trusted executor and checks the reported attempt
// against the fresh result.
class RevalidationService {
 public:
  using Clock = std::function<absl::Time()>;

  RevalidationService(executor::Executor* executor, absl::Duration time_budget,
                      Clock clock)
      : executor_(executor), time_budget_(time_budget), clock_(clock) {}

  // Throws executor::ExecutionError if the fresh run cannot take place.
  RevalidationResult Revalidate(const proto::Submission& submission,
                                const proto::TestBattery& battery,
                                const proto::Attempt& reported);

 private:
  executor::Executor* executor_;
  absl::Duration time_budget_;
  Clock clock_;
};

}  // namespace grading

#endif
