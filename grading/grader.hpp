#ifndef GRADING_GRADER_HPP
#define GRADING_GRADER_HPP

#include <functional>

#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "content/battery_provider.hpp"
#include "executor/executor.hpp"
#include "grading/reconciler.hpp"
#include "grading/revalidation.hpp"
#include "proto/grading.pb.h"
#include "store/store.hpp"

namespace grading {

struct GraderOptions {
  absl::Duration time_budget = absl::Seconds(5);
  // Limit on each of markup, style and script.
  size_t max_payload_bytes = 65536;
  int upsert_retries = 5;
  std::function<absl::Time()> clock = absl::Now;

  // Options configured by the command line flags.
  static GraderOptions FromFlags();
};

struct SubmitRequest {
  proto::Submission submission;
  // The attempt the client computed. When absent the grader computes the
  // provisional attempt itself.
  absl::optional<proto::Attempt> client_attempt;
};

// Grades submissions end to end: provisional run, revalidation on the
// trusted executor, progress update and attempt log.
class Grader {
 public:
  Grader(content::BatteryProvider* batteries,
         executor::Executor* client_executor,
         executor::Executor* server_executor, store::ProgressStore* store,
         GraderOptions options);

  // Returns the persisted attempt. Throws InvalidSubmission,
  // content::BatteryNotFound, ValidationMismatch, PersistenceConflict or
  // PersistenceUnavailable; executor::ExecutionError if a sandbox cannot be
  // run. Timeouts and faults of the submission are not errors, they yield an
  // attempt with status ERROR. Safe to call concurrently.
  proto::Attempt Submit(const SubmitRequest& request);

 private:
  void ValidateSubmission(const proto::Submission& submission) const;

  content::BatteryProvider* batteries_;
  executor::Executor* client_executor_;
  GraderOptions options_;
  RevalidationService revalidation_;
  ProgressReconciler reconciler_;
};

}  // namespace grading

#endif
