#include "grading/grader.hpp"

#include "glog/logging.h"
#include "grading/errors.hpp"
#include "grading/scorer.hpp"
#include "util/flags.hpp"

namespace grading {

GraderOptions GraderOptions::FromFlags() {
  GraderOptions options;
  options.time_budget = absl::Milliseconds(FLAGS_time_budget_ms);
  options.max_payload_bytes = FLAGS_max_payload_bytes;
  options.upsert_retries = FLAGS_progress_upsert_retries;
  return options;
}

Grader::Grader(content::BatteryProvider* batteries,
               executor::Executor* client_executor,
               executor::Executor* server_executor,
               store::ProgressStore* store, GraderOptions options)
    : batteries_(batteries),
      client_executor_(client_executor),
      options_(std::move(options)),
      revalidation_(server_executor, options_.time_budget, options_.clock),
      reconciler_(store, options_.upsert_retries) {}

void Grader::ValidateSubmission(const proto::Submission& submission) const {
  if (submission.user_id().empty()) throw InvalidSubmission("Missing user id");
  if (submission.challenge_id().empty()) {
    throw InvalidSubmission("Missing challenge id");
  }
  if (submission.content_version() < 0) {
    throw InvalidSubmission("Invalid content version");
  }
  auto check = [this](const char* channel, const std::string& payload) {
    if (payload.size() > options_.max_payload_bytes) {
      throw InvalidSubmission(std::string(channel) + " is " +
                              std::to_string(payload.size()) +
                              " bytes, the limit is " +
                              std::to_string(options_.max_payload_bytes));
    }
  };
  check("markup", submission.markup());
  check("style", submission.style());
  check("script", submission.script());
}

proto::Attempt Grader::Submit(const SubmitRequest& request) {
  const proto::Submission& submission = request.submission;
  std::string who = submission.user_id() + "/" + submission.challenge_id() +
                    "@" + std::to_string(submission.content_version());
  LOG(INFO) << "Attempt " << who << ": submitted";
  ValidateSubmission(submission);
  std::shared_ptr<const proto::TestBattery> battery = batteries_->GetBattery(
      submission.challenge_id(), submission.content_version());

  proto::Attempt provisional;
  if (request.client_attempt) {
    provisional = *request.client_attempt;
  } else {
    LOG(INFO) << "Attempt " << who << ": executing on "
              << client_executor_->Id();
    executor::ExecutionResult result = client_executor_->Execute(
        submission, *battery, options_.time_budget);
    provisional = BuildAttempt(submission, *battery, result, options_.clock());
  }
  LOG(INFO) << "Attempt " << who << ": finalized "
            << proto::AttemptStatus_Name(provisional.status()) << " "
            << provisional.score();

  LOG(INFO) << "Attempt " << who << ": revalidating";
  RevalidationResult revalidation =
      revalidation_.Revalidate(submission, *battery, provisional);
  if (!revalidation.accepted) {
    LOG(INFO) << "Attempt " << who << ": rejected";
    throw ValidationMismatch();
  }

  const proto::Attempt& accepted = revalidation.server_attempt;
  proto::ProgressRecord progress =
      reconciler_.Reconcile(accepted, options_.clock());
  LOG(INFO) << "Attempt " << who << ": persisted, best score "
            << progress.best_score() << " after " << progress.total_attempts()
            << " attempts";
  return accepted;
}

}  // namespace grading
