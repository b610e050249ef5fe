#ifndef GRADING_RECONCILER_HPP
#define GRADING_RECONCILER_HPP

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "proto/grading.pb.h"
#include "store/store.hpp"

namespace grading {

// Folds an accepted attempt into the progress of its (user, challenge). The
// best score and the attempt count never decrease, and a completed challenge
// stays completed with its original completion time.
proto::ProgressRecord Merge(const absl::optional<proto::ProgressRecord>& prior,
                            const proto::Attempt& attempt, absl::Time now);

// Persists accepted attempts. Updates of the same (user, challenge) are
// serialized within the process; races with other processes sharing the
// store are resolved by retrying the conditional upsert on a fresh read.
class ProgressReconciler {
 public:
  ProgressReconciler(store::ProgressStore* store, int max_retries)
      : store_(store), max_retries_(max_retries) {}

  // Commits the merged progress record, then appends the attempt. Returns
  // the committed record. Throws PersistenceConflict when the retries are
  // exhausted and PersistenceUnavailable when the store fails.
  proto::ProgressRecord Reconcile(const proto::Attempt& attempt,
                                  absl::Time now);

 private:
  using Key = std::pair<std::string, std::string>;
  struct KeyMutex {
    absl::Mutex mutex;
    int users = 0;
  };
  class KeyLock;

  store::ProgressStore* store_;
  int max_retries_;
  absl::Mutex keys_mutex_;
  std::map<Key, std::unique_ptr<KeyMutex>> keys_ GUARDED_BY(keys_mutex_);
};

}  // namespace grading

#endif
