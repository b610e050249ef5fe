#include "grading/scorer.hpp"

#include <algorithm>
#include <cmath>

#include "google/protobuf/util/time_util.h"

namespace grading {

double TestWeight(const proto::TestCase& test) {
  return test.has_weight() ? test.weight() : 1.0;
}

double TotalWeight(const proto::TestBattery& battery) {
  double total = 0;
  for (const proto::TestCase& test : battery.tests()) total += TestWeight(test);
  return total;
}

double Score(const std::vector<proto::TestOutcome>& outcomes,
             const proto::TestBattery& battery) {
  double total = TotalWeight(battery);
  if (total <= 0) return 0;
  double passed = 0;
  size_t count = std::min<size_t>(outcomes.size(), battery.tests_size());
  for (size_t i = 0; i < count; i++) {
    if (outcomes[i].passed()) passed += TestWeight(battery.tests(i));
  }
  double score = std::round(100 * passed / total * 100) / 100;
  return std::max(0.0, std::min(100.0, score));
}

proto::AttemptStatus Status(double score, proto::TerminationReason termination,
                            const proto::TestBattery& battery) {
  if (termination != proto::TerminationReason::NORMAL) {
    return proto::AttemptStatus::ERROR;
  }
  if (battery.tests_size() == 0 || TotalWeight(battery) <= 0) {
    return proto::AttemptStatus::ERROR;
  }
  return score == 100 ? proto::AttemptStatus::PASS
                      : proto::AttemptStatus::FAIL;
}

proto::Attempt BuildAttempt(const proto::Submission& submission,
                            const proto::TestBattery& battery,
                            const executor::ExecutionResult& result,
                            absl::Time now) {
  proto::Attempt attempt;
  *attempt.mutable_submission() = submission;
  for (const proto::TestOutcome& outcome : result.outcomes) {
    *attempt.add_outcomes() = outcome;
  }
  for (const proto::LogEntry& log : result.logs) {
    *attempt.add_runtime_logs() = log;
  }
  attempt.set_score(Score(result.outcomes, battery));
  attempt.set_status(
      Status(attempt.score(), result.termination_reason, battery));
  attempt.set_termination_reason(result.termination_reason);
  attempt.set_execution_time_ms(result.duration_ms);
  *attempt.mutable_created_at() =
      google::protobuf::util::TimeUtil::NanosecondsToTimestamp(
          absl::ToUnixNanos(now));
  return attempt;
}

}  // namespace grading
