#include "grading/revalidation.hpp"

#include <cmath>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "google/protobuf/util/message_differencer.h"
#include "grading/scorer.hpp"

namespace grading {

std::vector<std::string> CompareAttempts(const proto::Attempt& reported,
                                         const proto::Attempt& expected) {
  std::vector<std::string> diffs;
  if (!google::protobuf::util::MessageDifferencer::Equals(
          reported.submission(), expected.submission())) {
    diffs.push_back("submission differs");
  }
  if (reported.status() != expected.status()) {
    diffs.push_back(absl::StrCat(
        "status: reported ", proto::AttemptStatus_Name(reported.status()),
        ", expected ", proto::AttemptStatus_Name(expected.status())));
  }
  // NaN never compares within tolerance.
  if (!(std::fabs(reported.score() - expected.score()) <= kScoreTolerance)) {
    diffs.push_back(absl::StrCat("score: reported ", reported.score(),
                                 ", expected ", expected.score()));
  }
  if (reported.outcomes_size() != expected.outcomes_size()) {
    diffs.push_back(absl::StrCat("outcomes: reported ",
                                 reported.outcomes_size(), ", expected ",
                                 expected.outcomes_size()));
    return diffs;
  }
  for (int i = 0; i < expected.outcomes_size(); i++) {
    if (reported.outcomes(i).passed() != expected.outcomes(i).passed()) {
      diffs.push_back(absl::StrCat(
          "test ", i, " (", expected.outcomes(i).name(), "): reported ",
          reported.outcomes(i).passed() ? "pass" : "fail", ", expected ",
          expected.outcomes(i).passed() ? "pass" : "fail"));
    }
  }
  return diffs;
}

RevalidationResult RevalidationService::Revalidate(
    const proto::Submission& submission, const proto::TestBattery& battery,
    const proto::Attempt& reported) {
  executor::ExecutionResult execution =
      executor_->Execute(submission, battery, time_budget_);
  RevalidationResult result;
  result.server_attempt =
      BuildAttempt(submission, battery, execution, clock_());
  std::vector<std::string> diffs =
      CompareAttempts(reported, result.server_attempt);
  if (diffs.empty()) {
    result.accepted = true;
    return result;
  }
  LOG(WARNING) << "Validation mismatch for user " << submission.user_id()
               << " on " << submission.challenge_id() << "@"
               << submission.content_version() << " (executor "
               << executor_->Id() << "): " << absl::StrJoin(diffs, "; ");
  result.reason = "ValidationMismatch";
  return result;
}

}  // namespace grading
