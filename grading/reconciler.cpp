#include "grading/reconciler.hpp"

#include <algorithm>

#include "glog/logging.h"
#include "google/protobuf/util/time_util.h"
#include "grading/errors.hpp"

namespace grading {

namespace {

google::protobuf::Timestamp ToTimestamp(absl::Time time) {
  return google::protobuf::util::TimeUtil::NanosecondsToTimestamp(
      absl::ToUnixNanos(time));
}

}  // namespace

proto::ProgressRecord Merge(const absl::optional<proto::ProgressRecord>& prior,
                            const proto::Attempt& attempt, absl::Time now) {
  proto::ProgressRecord record;
  bool full_score = attempt.score() == 100;
  if (!prior) {
    record.set_user_id(attempt.submission().user_id());
    record.set_challenge_id(attempt.submission().challenge_id());
    record.set_best_score(attempt.score());
    record.set_total_attempts(1);
    record.set_status(full_score ? proto::ProgressStatus::COMPLETED
                                 : proto::ProgressStatus::IN_PROGRESS);
    if (full_score) *record.mutable_completed_at() = ToTimestamp(now);
    *record.mutable_last_attempt_at() = ToTimestamp(now);
    return record;
  }
  record = *prior;
  record.set_best_score(std::max(prior->best_score(), attempt.score()));
  record.set_total_attempts(prior->total_attempts() + 1);
  *record.mutable_last_attempt_at() = ToTimestamp(now);
  if (prior->status() != proto::ProgressStatus::COMPLETED) {
    if (full_score) {
      record.set_status(proto::ProgressStatus::COMPLETED);
      *record.mutable_completed_at() = ToTimestamp(now);
    } else {
      record.set_status(proto::ProgressStatus::IN_PROGRESS);
    }
  }
  return record;
}

// Holds the mutex of a key; the entry is dropped with its last user.
class ProgressReconciler::KeyLock {
 public:
  KeyLock(ProgressReconciler* reconciler, Key key)
      : reconciler_(reconciler), key_(std::move(key)) {
    {
      absl::MutexLock lock(&reconciler_->keys_mutex_);
      std::unique_ptr<KeyMutex>& entry = reconciler_->keys_[key_];
      if (!entry) entry.reset(new KeyMutex());
      entry->users++;
      key_mutex_ = entry.get();
    }
    key_mutex_->mutex.Lock();
  }
  ~KeyLock() {
    key_mutex_->mutex.Unlock();
    absl::MutexLock lock(&reconciler_->keys_mutex_);
    if (--key_mutex_->users == 0) reconciler_->keys_.erase(key_);
  }
  KeyLock(const KeyLock&) = delete;
  KeyLock& operator=(const KeyLock&) = delete;

 private:
  ProgressReconciler* reconciler_;
  Key key_;
  KeyMutex* key_mutex_ = nullptr;
};

proto::ProgressRecord ProgressReconciler::Reconcile(
    const proto::Attempt& attempt, absl::Time now) {
  const std::string& user_id = attempt.submission().user_id();
  const std::string& challenge_id = attempt.submission().challenge_id();
  KeyLock lock(this, Key(user_id, challenge_id));

  absl::optional<proto::ProgressRecord> committed;
  for (int attempt_number = 0; attempt_number <= max_retries_ && !committed;
       attempt_number++) {
    if (attempt_number > 0) {
      VLOG(1) << "Retrying progress update for " << user_id << "/"
              << challenge_id << " (" << attempt_number << ")";
    }
    try {
      committed = store_->UpsertProgress(
          user_id, challenge_id,
          [&attempt, now](const absl::optional<proto::ProgressRecord>& prior) {
            return Merge(prior, attempt, now);
          });
    } catch (const store::StoreUnavailable& e) {
      LOG(ERROR) << "Progress update for " << user_id << "/" << challenge_id
                 << " failed: " << e.what();
      throw PersistenceUnavailable(e.what());
    }
  }
  if (!committed) {
    LOG(WARNING) << "Giving up progress update for " << user_id << "/"
                 << challenge_id << " after " << max_retries_ + 1
                 << " conflicts";
    throw PersistenceConflict("Progress of " + user_id + " on " +
                              challenge_id + " kept changing");
  }
  try {
    store_->AppendAttempt(attempt);
  } catch (const store::StoreUnavailable& e) {
    LOG(ERROR) << "Progress of " << user_id << "/" << challenge_id
               << " was updated but the attempt could not be appended: "
               << e.what();
    throw PersistenceUnavailable(e.what());
  }
  return *committed;
}

}  // namespace grading
