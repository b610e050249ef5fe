#ifndef STORE_STORE_HPP
#define STORE_STORE_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "proto/grading.pb.h"

namespace store {

// The backing storage could not be reached or returned an I/O error. The
// operation may or may not have taken effect.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Computes the new progress record from the current one, which is absent if
// the user never made an accepted attempt on the challenge.
using MergeFunction = std::function<proto::ProgressRecord(
    const absl::optional<proto::ProgressRecord>& prior)>;

class ProgressStore {
 public:
  // Appends an attempt to the log of its (user, challenge). Attempts are
  // never modified or removed once appended.
  virtual void AppendAttempt(const proto::Attempt& attempt) = 0;

  // Reads the current record, computes merge(current) and stores it only if
  // the record was not changed in the meantime. Returns the stored record,
  // or absl::nullopt if another writer got there first.
  virtual absl::optional<proto::ProgressRecord> UpsertProgress(
      const std::string& user_id, const std::string& challenge_id,
      const MergeFunction& merge) = 0;

  virtual absl::optional<proto::ProgressRecord> GetProgress(
      const std::string& user_id, const std::string& challenge_id) = 0;

  // Attempts of a (user, challenge), oldest first.
  virtual std::vector<proto::Attempt> ListAttempts(
      const std::string& user_id, const std::string& challenge_id) = 0;

  ProgressStore() = default;
  virtual ~ProgressStore() = default;
  ProgressStore(const ProgressStore&) = delete;
  ProgressStore& operator=(const ProgressStore&) = delete;
  ProgressStore(ProgressStore&&) = delete;
  ProgressStore& operator=(ProgressStore&&) = delete;
};

}  // namespace store

#endif
