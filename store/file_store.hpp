#ifndef STORE_FILE_STORE_HPP
#define STORE_FILE_STORE_HPP

#include "store/store.hpp"

namespace store {

// Stores everything under a directory, one subdirectory per (user,
// challenge):
//   <root>/<user>/<challenge>/progress    StoredProgress, replaced atomically
//   <root>/<user>/<challenge>/attempts    length-delimited Attempt messages
//   <root>/<user>/<challenge>/lock        flock(2) target for writers
// Several processes can share the same root.
class FileStore : public ProgressStore {
 public:
  explicit FileStore(std::string root);

  void AppendAttempt(const proto::Attempt& attempt) override;
  absl::optional<proto::ProgressRecord> UpsertProgress(
      const std::string& user_id, const std::string& challenge_id,
      const MergeFunction& merge) override;
  absl::optional<proto::ProgressRecord> GetProgress(
      const std::string& user_id, const std::string& challenge_id) override;
  std::vector<proto::Attempt> ListAttempts(
      const std::string& user_id, const std::string& challenge_id) override;

 private:
  static const constexpr char* kProgressFile = "progress";
  static const constexpr char* kAttemptsFile = "attempts";
  static const constexpr char* kLockFile = "lock";

  std::string KeyDir(const std::string& user_id,
                     const std::string& challenge_id) const;
  // Returns version 0 and an empty record if there is no progress file.
  proto::StoredProgress ReadProgress(const std::string& dir) const;

  std::string root_;
};

}  // namespace store

#endif
