#ifndef GRADING_SCORER_HPP
#define GRADING_SCORER_HPP

#include <vector>

#include "absl/time/time.h"
#include "executor/executor.hpp"
#include "proto/grading.pb.h"

namespace grading {

// Weight of a test, 1 when the battery does not set one.
double TestWeight(const proto::TestCase& test);

double TotalWeight(const proto::TestBattery& battery);

// Percentage of the total weight carried by passed outcomes, rounded to two
// decimals and clamped to [0, 100]. Outcomes are index-aligned with the
// battery tests. A battery with no weight scores 0.
double Score(const std::vector<proto::TestOutcome>& outcomes,
             const proto::TestBattery& battery);

// ERROR for abnormal terminations and for batteries that cannot be passed,
// otherwise PASS for a full score and FAIL for anything less.
proto::AttemptStatus Status(double score, proto::TerminationReason termination,
                            const proto::TestBattery& battery);

// Assembles the attempt for an execution of submission against battery.
proto::Attempt BuildAttempt(const proto::Submission& submission,
                            const proto::TestBattery& battery,
                            const executor::ExecutionResult& result,
                            absl::Time now);

}  // namespace grading

#endif
