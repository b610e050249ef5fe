#ifndef STORE_MEMORY_STORE_HPP
#define STORE_MEMORY_STORE_HPP

#include <map>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "store/store.hpp"

namespace store {

// Keeps everything in memory. Progress records carry a version that is
// bumped on every write; an upsert commits only if the version it read is
// still current.
class MemoryStore : public ProgressStore {
 public:
  void AppendAttempt(const proto::Attempt& attempt) override;
  absl::optional<proto::ProgressRecord> UpsertProgress(
      const std::string& user_id, const std::string& challenge_id,
      const MergeFunction& merge) override;
  absl::optional<proto::ProgressRecord> GetProgress(
      const std::string& user_id, const std::string& challenge_id) override;
  std::vector<proto::Attempt> ListAttempts(
      const std::string& user_id, const std::string& challenge_id) override;

 private:
  using Key = std::pair<std::string, std::string>;
  struct VersionedRecord {
    int64_t version = 0;
    proto::ProgressRecord record;
  };

  absl::Mutex mutex_;
  std::map<Key, VersionedRecord> progress_ GUARDED_BY(mutex_);
  std::map<Key, std::vector<proto::Attempt>> attempts_ GUARDED_BY(mutex_);
};

}  // namespace store

#endif
