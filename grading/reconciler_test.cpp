#include "grading/reconciler.hpp"

#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "grading/errors.hpp"
#include "gtest/gtest.h"
#include "store/memory_store.hpp"

namespace {

using grading::Merge;
using grading::ProgressReconciler;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

const absl::Time kFirst = absl::FromUnixSeconds(1000);
const absl::Time kSecond = absl::FromUnixSeconds(2000);

proto::Attempt AttemptWithScore(double score) {
  proto::Attempt attempt;
  attempt.mutable_submission()->set_user_id("u");
  attempt.mutable_submission()->set_challenge_id("c");
  attempt.set_score(score);
  return attempt;
}

TEST(MergeTest, FirstAttempt) {
  proto::ProgressRecord record =
      Merge(absl::nullopt, AttemptWithScore(0), kFirst);
  EXPECT_EQ(record.user_id(), "u");
  EXPECT_EQ(record.challenge_id(), "c");
  EXPECT_EQ(record.status(), proto::ProgressStatus::IN_PROGRESS);
  EXPECT_DOUBLE_EQ(record.best_score(), 0);
  EXPECT_EQ(record.total_attempts(), 1);
  EXPECT_FALSE(record.has_completed_at());
  EXPECT_EQ(record.last_attempt_at().seconds(), 1000);
}

TEST(MergeTest, FirstAttemptCompletes) {
  proto::ProgressRecord record =
      Merge(absl::nullopt, AttemptWithScore(100), kFirst);
  EXPECT_EQ(record.status(), proto::ProgressStatus::COMPLETED);
  EXPECT_EQ(record.completed_at().seconds(), 1000);
}

TEST(MergeTest, BestScoreNeverDecreases) {
  proto::ProgressRecord prior =
      Merge(absl::nullopt, AttemptWithScore(80), kFirst);
  proto::ProgressRecord record = Merge(prior, AttemptWithScore(30), kSecond);
  EXPECT_DOUBLE_EQ(record.best_score(), 80);
  EXPECT_EQ(record.total_attempts(), 2);
  EXPECT_EQ(record.status(), proto::ProgressStatus::IN_PROGRESS);
  EXPECT_EQ(record.last_attempt_at().seconds(), 2000);
  record = Merge(record, AttemptWithScore(90.5), kSecond);
  EXPECT_DOUBLE_EQ(record.best_score(), 90.5);
  EXPECT_EQ(record.total_attempts(), 3);
}

TEST(MergeTest, CompletionHappensOnce) {
  proto::ProgressRecord record =
      Merge(absl::nullopt, AttemptWithScore(50), kFirst);
  record = Merge(record, AttemptWithScore(100), kFirst);
  EXPECT_EQ(record.status(), proto::ProgressStatus::COMPLETED);
  EXPECT_EQ(record.completed_at().seconds(), 1000);
  record = Merge(record, AttemptWithScore(10), kSecond);
  EXPECT_EQ(record.status(), proto::ProgressStatus::COMPLETED);
  EXPECT_DOUBLE_EQ(record.best_score(), 100);
  record = Merge(record, AttemptWithScore(100), kSecond);
  EXPECT_EQ(record.completed_at().seconds(), 1000);
  EXPECT_EQ(record.last_attempt_at().seconds(), 2000);
  EXPECT_EQ(record.total_attempts(), 4);
}

// Loses the first races it takes part in.
class FlakyStore : public store::MemoryStore {
 public:
  explicit FlakyStore(int conflicts) : conflicts_(conflicts) {}
  absl::optional<proto::ProgressRecord> UpsertProgress(
      const std::string& user_id, const std::string& challenge_id,
      const store::MergeFunction& merge) override {
    calls_++;
    if (conflicts_ > 0) {
      conflicts_--;
      return absl::nullopt;
    }
    return MemoryStore::UpsertProgress(user_id, challenge_id, merge);
  }
  int calls() const { return calls_; }

 private:
  int conflicts_;
  int calls_ = 0;
};

class MockStore : public store::ProgressStore {
 public:
  MOCK_METHOD(void, AppendAttempt, (const proto::Attempt& attempt),
              (override));
  MOCK_METHOD(absl::optional<proto::ProgressRecord>, UpsertProgress,
              (const std::string& user_id, const std::string& challenge_id,
               const store::MergeFunction& merge),
              (override));
  MOCK_METHOD(absl::optional<proto::ProgressRecord>, GetProgress,
              (const std::string& user_id, const std::string& challenge_id),
              (override));
  MOCK_METHOD(std::vector<proto::Attempt>, ListAttempts,
              (const std::string& user_id, const std::string& challenge_id),
              (override));
};

TEST(ReconcilerTest, PersistsProgressAndAttempt) {
  store::MemoryStore store;
  ProgressReconciler reconciler(&store, 5);
  proto::ProgressRecord record =
      reconciler.Reconcile(AttemptWithScore(40), kFirst);
  EXPECT_EQ(record.total_attempts(), 1);
  record = reconciler.Reconcile(AttemptWithScore(100), kSecond);
  EXPECT_EQ(record.total_attempts(), 2);
  EXPECT_EQ(record.status(), proto::ProgressStatus::COMPLETED);
  ASSERT_TRUE(store.GetProgress("u", "c"));
  EXPECT_EQ(store.GetProgress("u", "c")->completed_at().seconds(), 2000);
  EXPECT_EQ(store.ListAttempts("u", "c").size(), 2u);
}

TEST(ReconcilerTest, ConflictsAreRetried) {
  FlakyStore store(3);
  ProgressReconciler reconciler(&store, 5);
  proto::ProgressRecord record =
      reconciler.Reconcile(AttemptWithScore(40), kFirst);
  EXPECT_EQ(record.total_attempts(), 1);
  EXPECT_EQ(store.calls(), 4);
  EXPECT_EQ(store.ListAttempts("u", "c").size(), 1u);
}

TEST(ReconcilerTest, ExhaustedRetriesPersistNothing) {
  FlakyStore store(6);
  ProgressReconciler reconciler(&store, 5);
  EXPECT_THROW(reconciler.Reconcile(AttemptWithScore(40), kFirst),
               grading::PersistenceConflict);
  EXPECT_EQ(store.calls(), 6);
  EXPECT_FALSE(store.GetProgress("u", "c"));
  EXPECT_TRUE(store.ListAttempts("u", "c").empty());
}

TEST(ReconcilerTest, ProgressIsCommittedBeforeTheAttempt) {
  MockStore store;
  ProgressReconciler reconciler(&store, 0);
  proto::ProgressRecord committed;
  committed.set_total_attempts(1);
  {
    InSequence sequence;
    EXPECT_CALL(store, UpsertProgress("u", "c", _))
        .WillOnce(Return(committed));
    EXPECT_CALL(store, AppendAttempt(_));
  }
  EXPECT_EQ(reconciler.Reconcile(AttemptWithScore(1), kFirst).total_attempts(),
            1);
}

TEST(ReconcilerTest, StoreFailuresAreUnavailable) {
  MockStore store;
  ProgressReconciler reconciler(&store, 5);
  EXPECT_CALL(store, UpsertProgress(_, _, _))
      .WillOnce(Throw(store::StoreUnavailable("disk on fire")));
  EXPECT_CALL(store, AppendAttempt(_)).Times(0);
  EXPECT_THROW(reconciler.Reconcile(AttemptWithScore(1), kFirst),
               grading::PersistenceUnavailable);

  EXPECT_CALL(store, UpsertProgress(_, _, _))
      .WillOnce(Return(proto::ProgressRecord()));
  EXPECT_CALL(store, AppendAttempt(_))
      .WillOnce(Throw(store::StoreUnavailable("disk on fire")));
  EXPECT_THROW(reconciler.Reconcile(AttemptWithScore(1), kFirst),
               grading::PersistenceUnavailable);
}

TEST(ReconcilerTest, SameKeyUpdatesAreSerialized) {
  store::MemoryStore store;
  // Without retries any interleaving would surface as a conflict.
  ProgressReconciler reconciler(&store, 0);
  const int kThreads = 16;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&reconciler, i]() {
      reconciler.Reconcile(AttemptWithScore(i * 5), kFirst);
    });
  }
  for (std::thread& thread : threads) thread.join();
  ASSERT_TRUE(store.GetProgress("u", "c"));
  EXPECT_EQ(store.GetProgress("u", "c")->total_attempts(), kThreads);
  EXPECT_DOUBLE_EQ(store.GetProgress("u", "c")->best_score(), 75);
  EXPECT_EQ(store.ListAttempts("u", "c").size(), static_cast<size_t>(kThreads));
}

}  // namespace
