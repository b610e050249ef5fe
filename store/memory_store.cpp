#include "store/memory_store.hpp"

namespace store {

void MemoryStore::AppendAttempt(const proto::Attempt& attempt) {
  absl::MutexLock lock(&mutex_);
  attempts_[Key(attempt.submission().user_id(),
                attempt.submission().challenge_id())]
      .push_back(attempt);
}

absl::optional<proto::ProgressRecord> MemoryStore::UpsertProgress(
    const std::string& user_id, const std::string& challenge_id,
    const MergeFunction& merge) {
  Key key(user_id, challenge_id);
  int64_t read_version = 0;
  absl::optional<proto::ProgressRecord> prior;
  {
    absl::MutexLock lock(&mutex_);
    auto it = progress_.find(key);
    if (it != progress_.end()) {
      read_version = it->second.version;
      prior = it->second.record;
    }
  }
  // The merge runs unlocked, so concurrent writers can interleave here.
  proto::ProgressRecord merged = merge(prior);
  absl::MutexLock lock(&mutex_);
  VersionedRecord& current = progress_[key];
  if (current.version != read_version) return absl::nullopt;
  current.version++;
  current.record = merged;
  return merged;
}

absl::optional<proto::ProgressRecord> MemoryStore::GetProgress(
    const std::string& user_id, const std::string& challenge_id) {
  absl::MutexLock lock(&mutex_);
  auto it = progress_.find(Key(user_id, challenge_id));
  if (it == progress_.end() || it->second.version == 0) return absl::nullopt;
  return it->second.record;
}

std::vector<proto::Attempt> MemoryStore::ListAttempts(
    const std::string& user_id, const std::string& challenge_id) {
  absl::MutexLock lock(&mutex_);
  auto it = attempts_.find(Key(user_id, challenge_id));
  if (it == attempts_.end()) return {};
  return it->second;
}

}  // namespace store
