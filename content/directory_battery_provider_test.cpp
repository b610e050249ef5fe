#include "content/directory_battery_provider.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using content::BatteryNotFound;
using content::DirectoryBatteryProvider;
using content::InvalidBattery;
using ::testing::HasSubstr;

class DirectoryBatteryProviderTest : public ::testing::Test {
 protected:
  DirectoryBatteryProviderTest()
      : dir_(::testing::TempDir()), provider_(dir_.Path()) {}

  void Publish(const std::string& challenge, int64_t version,
               const std::string& json) {
    util::File::Write(
        util::File::JoinPath(util::File::JoinPath(dir_.Path(), challenge),
                             std::to_string(version) + ".json"),
        json, /*overwrite=*/true);
  }

  util::TempDir dir_;
  DirectoryBatteryProvider provider_;
};

TEST_F(DirectoryBatteryProviderTest, LoadsPublishedBattery) {
  Publish("buttons", 3, R"json({
    "challengeId": "buttons",
    "contentVersion": "3",
    "tests": [
      {"name": "exists", "assertion": "document.querySelector('button')"},
      {"name": "label", "assertion": "true", "weight": 2.5}
    ]
  })json");
  std::shared_ptr<const proto::TestBattery> battery =
      provider_.GetBattery("buttons", 3);
  ASSERT_TRUE(battery);
  ASSERT_EQ(battery->tests_size(), 2);
  EXPECT_EQ(battery->tests(0).name(), "exists");
  EXPECT_FALSE(battery->tests(0).has_weight());
  EXPECT_DOUBLE_EQ(battery->tests(1).weight(), 2.5);
}

TEST_F(DirectoryBatteryProviderTest, BatteriesAreCached) {
  Publish("c", 1, R"({"challengeId": "c", "contentVersion": 1})");
  std::shared_ptr<const proto::TestBattery> first = provider_.GetBattery("c", 1);
  // Published versions are immutable, later edits are not picked up.
  Publish("c", 1, R"({"challengeId": "c", "contentVersion": 1,
                      "tests": [{"name": "t", "assertion": "true"}]})");
  std::shared_ptr<const proto::TestBattery> second =
      provider_.GetBattery("c", 1);
  EXPECT_EQ(first, second);
  EXPECT_EQ(second->tests_size(), 0);
}

TEST_F(DirectoryBatteryProviderTest, VersionsAreIndependent) {
  Publish("c", 1, R"({"challengeId": "c", "contentVersion": 1})");
  Publish("c", 2, R"({"challengeId": "c", "contentVersion": 2,
                      "tests": [{"name": "t", "assertion": "true"}]})");
  EXPECT_EQ(provider_.GetBattery("c", 1)->tests_size(), 0);
  EXPECT_EQ(provider_.GetBattery("c", 2)->tests_size(), 1);
}

TEST_F(DirectoryBatteryProviderTest, MissingBattery) {
  Publish("c", 1, R"({"challengeId": "c", "contentVersion": 1})");
  EXPECT_THROW(provider_.GetBattery("c", 2), BatteryNotFound);
  EXPECT_THROW(provider_.GetBattery("d", 1), BatteryNotFound);
  EXPECT_THROW(provider_.GetBattery("../c", 1), BatteryNotFound);
  EXPECT_THROW(provider_.GetBattery("", 1), BatteryNotFound);
  EXPECT_THROW(provider_.GetBattery("c", -1), BatteryNotFound);
}

TEST_F(DirectoryBatteryProviderTest, RejectsInvalidBatteries) {
  Publish("garbage", 1, "{not json");
  Publish("unknown", 1, R"({"challengeId": "unknown", "contentVersion": 1,
                            "extra": true})");
  Publish("wrong", 1, R"({"challengeId": "other", "contentVersion": 1})");
  Publish("stale", 2, R"({"challengeId": "stale", "contentVersion": 1})");
  Publish("negative", 1, R"({"challengeId": "negative", "contentVersion": 1,
      "tests": [{"name": "t", "assertion": "true", "weight": -1}]})");
  Publish("unnamed", 1, R"({"challengeId": "unnamed", "contentVersion": 1,
      "tests": [{"assertion": "true"}]})");
  EXPECT_THROW(provider_.GetBattery("garbage", 1), InvalidBattery);
  EXPECT_THROW(provider_.GetBattery("unknown", 1), InvalidBattery);
  EXPECT_THROW(provider_.GetBattery("stale", 2), InvalidBattery);
  EXPECT_THROW(provider_.GetBattery("negative", 1), InvalidBattery);
  EXPECT_THROW(provider_.GetBattery("unnamed", 1), InvalidBattery);
  try {
    provider_.GetBattery("wrong", 1);
    ADD_FAILURE() << "InvalidBattery not thrown";
  } catch (const InvalidBattery& e) {
    EXPECT_THAT(e.what(), HasSubstr("'other'"));
  }
}

}  // namespace
