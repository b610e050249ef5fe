#ifndef CONTENT_BATTERY_PROVIDER_HPP
#define CONTENT_BATTERY_PROVIDER_HPP

#include <memory>
#include <stdexcept>
#include <string>

#include "proto/grading.pb.h"

namespace content {

// No battery is published for the requested challenge and version.
class BatteryNotFound : public std::runtime_error {
 public:
  explicit BatteryNotFound(const std::string& msg) : std::runtime_error(msg) {}
};

// A battery exists but cannot be used for grading.
class InvalidBattery : public std::runtime_error {
 public:
  explicit InvalidBattery(const std::string& msg) : std::runtime_error(msg) {}
};

class BatteryProvider {
 public:
  // Returns the battery pinned to the given content version. The returned
  // battery never changes.
  virtual std::shared_ptr<const proto::TestBattery> GetBattery(
      const std::string& challenge_id, int64_t content_version) = 0;

  BatteryProvider() = default;
  virtual ~BatteryProvider() = default;
  BatteryProvider(const BatteryProvider&) = delete;
  BatteryProvider& operator=(const BatteryProvider&) = delete;
  BatteryProvider(BatteryProvider&&) = delete;
  BatteryProvider& operator=(BatteryProvider&&) = delete;
};

// Checks that the battery belongs to the given challenge and version and
// that its weights are usable. Throws InvalidBattery otherwise.
void ValidateBattery(const proto::TestBattery& battery,
                     const std::string& challenge_id, int64_t content_version);

}  // namespace content

#endif
