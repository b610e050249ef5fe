#include "content/directory_battery_provider.hpp"

#include <cerrno>
#include <system_error>

#include "absl/strings/ascii.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"

namespace content {

namespace {

// Challenge ids become directory names, so they must not walk the tree.
bool IsSafeId(const std::string& id) {
  if (id.empty() || id[0] == '.') return false;
  for (char c : id) {
    if (!absl::ascii_isalnum(c) && c != '-' && c != '_' && c != '.') {
      return false;
    }
  }
  return true;
}

}  // namespace

std::shared_ptr<const proto::TestBattery> DirectoryBatteryProvider::Load(
    const std::string& challenge_id, int64_t content_version) const {
  std::string path = util::File::JoinPath(
      util::File::JoinPath(root_, challenge_id),
      std::to_string(content_version) + ".json");
  std::string json;
  try {
    json = util::File::ReadAll(path);
  } catch (const std::system_error& e) {
    if (e.code().value() == ENOENT) {
      throw BatteryNotFound("No battery for challenge '" + challenge_id +
                            "' version " + std::to_string(content_version));
    }
    throw;
  }
  auto battery = std::make_shared<proto::TestBattery>();
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  auto status =
      google::protobuf::util::JsonStringToMessage(json, battery.get(), options);
  if (!status.ok()) {
    throw InvalidBattery("Cannot parse " + path + ": " + status.ToString());
  }
  ValidateBattery(*battery, challenge_id, content_version);
  LOG(INFO) << "Loaded battery " << challenge_id << "@" << content_version
            << " with " << battery->tests_size() << " tests";
  return battery;
}

std::shared_ptr<const proto::TestBattery> DirectoryBatteryProvider::GetBattery(
    const std::string& challenge_id, int64_t content_version) {
  if (!IsSafeId(challenge_id) || content_version < 0) {
    throw BatteryNotFound("No battery for challenge '" + challenge_id +
                          "' version " + std::to_string(content_version));
  }
  auto key = std::make_pair(challenge_id, content_version);
  {
    absl::MutexLock lock(&mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
  }
  std::shared_ptr<const proto::TestBattery> battery =
      Load(challenge_id, content_version);
  absl::MutexLock lock(&mutex_);
  // A concurrent load of the same battery may have won; keep the first one.
  return cache_.emplace(key, battery).first->second;
}

}  // namespace content
