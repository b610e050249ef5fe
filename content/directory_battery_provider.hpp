#ifndef CONTENT_DIRECTORY_BATTERY_PROVIDER_HPP
#define CONTENT_DIRECTORY_BATTERY_PROVIDER_HPP

#include <map>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "content/battery_provider.hpp"

namespace content {

// Reads batteries from <root>/<challenge_id>/<content_version>.json, written
// in the protobuf JSON mapping of TestBattery. Batteries are cached forever
// once loaded, since a published version never changes.
class DirectoryBatteryProvider : public BatteryProvider {
 public:
  explicit DirectoryBatteryProvider(std::string root)
      : root_(std::move(root)) {}

  std::shared_ptr<const proto::TestBattery> GetBattery(
      const std::string& challenge_id, int64_t content_version) override;

 private:
  std::shared_ptr<const proto::TestBattery> Load(
      const std::string& challenge_id, int64_t content_version) const;

  std::string root_;
  absl::Mutex mutex_;
  std::map<std::pair<std::string, int64_t>,
           std::shared_ptr<const proto::TestBattery>>
      cache_ GUARDED_BY(mutex_);
};

}  // namespace content

#endif
