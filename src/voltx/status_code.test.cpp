//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/status_code.hpp>
//
#include <voltx/status_code.hpp>

#include <voltx/status.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

namespace {

using voltx::make_status;
using voltx::StatusCode;

TEST(StatusCodeTest, RegisteredMessages)
{
  EXPECT_TRUE(voltx::initialize_status_codes());

  batt::Status status = make_status(StatusCode::kInvalidAuthKey);

  EXPECT_FALSE(status.ok());
  EXPECT_THAT(batt::to_string(status), ::testing::HasSubstr("kInvalidAuthKey"));
  EXPECT_THAT(batt::to_string(make_status(StatusCode::kTransferNotFound)),
              ::testing::HasSubstr("Transfer could not be found"));
}

TEST(StatusCodeTest, StatusIs)
{
  batt::Status status = make_status(StatusCode::kInvalidVolume);

  EXPECT_TRUE(voltx::status_is(status, StatusCode::kInvalidVolume));
  EXPECT_FALSE(voltx::status_is(status, StatusCode::kVolumeNotFound));
  EXPECT_FALSE(voltx::status_is(batt::OkStatus(), StatusCode::kInvalidVolume));
  EXPECT_EQ(status, make_status(StatusCode::kInvalidVolume));
  EXPECT_NE(status, batt::Status{batt::StatusCode::kInvalidArgument});
}

}  // namespace
