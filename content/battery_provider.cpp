#include "content/battery_provider.hpp"

#include <cmath>

namespace content {

void ValidateBattery(const proto::TestBattery& battery,
                     const std::string& challenge_id,
                     int64_t content_version) {
  if (battery.challenge_id() != challenge_id) {
    throw InvalidBattery("Battery is for challenge '" +
                         battery.challenge_id() + "', not '" + challenge_id +
                         "'");
  }
  if (battery.content_version() != content_version) {
    throw InvalidBattery("Battery has content version " +
                         std::to_string(battery.content_version()) +
                         ", expected " + std::to_string(content_version));
  }
  for (const proto::TestCase& test : battery.tests()) {
    if (test.name().empty()) throw InvalidBattery("Test without a name");
    if (!test.has_weight()) continue;
    if (!std::isfinite(test.weight()) || test.weight() < 0) {
      throw InvalidBattery("Test '" + test.name() + "' has invalid weight " +
                           std::to_string(test.weight()));
    }
  }
}

}  // namespace content
