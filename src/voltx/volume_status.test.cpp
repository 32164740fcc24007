//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/volume_status.hpp>
//
#include <voltx/volume_status.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

#include <set>

namespace {

using voltx::VolumeStatus;

TEST(VolumeStatusTest, WireNames)
{
  EXPECT_EQ(voltx::to_string_view(VolumeStatus::kAvailable), "available");
  EXPECT_EQ(voltx::to_string_view(VolumeStatus::kAwaitingTransfer), "awaiting-transfer");
  EXPECT_EQ(voltx::to_string_view(VolumeStatus::kInUse), "in-use");
  EXPECT_EQ(voltx::to_string_view(VolumeStatus::kErrorDeleting), "error_deleting");
  EXPECT_EQ(batt::to_string(VolumeStatus::kBackingUp), "backing-up");
}

TEST(VolumeStatusTest, ParseEveryStatus)
{
  std::set<std::string_view> names;

  for (VolumeStatus status : voltx::kAllVolumeStatuses) {
    std::string_view name = voltx::to_string_view(status);
    names.insert(name);

    batt::StatusOr<VolumeStatus> parsed = voltx::parse_volume_status(name);
    ASSERT_TRUE(parsed.ok()) << BATT_INSPECT(name);
    EXPECT_EQ(*parsed, status);
  }

  EXPECT_EQ(names.size(), voltx::kAllVolumeStatuses.size());
}

TEST(VolumeStatusTest, ParseUnknown)
{
  for (std::string_view name : {"", "Available", "awaiting_transfer", "in_use", "bogus"}) {
    batt::StatusOr<VolumeStatus> parsed = voltx::parse_volume_status(name);

    EXPECT_TRUE(voltx::status_is(parsed.status(), voltx::StatusCode::kInvalidVolumeStatusString))
        << BATT_INSPECT(name);
  }
}

}  // namespace
