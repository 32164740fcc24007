//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/transfer_manager_options.hpp>
//
#include <voltx/transfer_manager_options.hpp>

#include <batteries/assert.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>

namespace {

using voltx::TransferManagerOptions;

TEST(TransferManagerOptionsTest, Defaults)
{
  TransferManagerOptions options;

  EXPECT_EQ(options.name(), "default");
  EXPECT_EQ(options.auth_key_length().value(), 16u);
  EXPECT_EQ(options.salt_length().value(), 8u);

  options.set_name("east").set_auth_key_length(32).set_salt_length(4);

  EXPECT_EQ(options.name(), "east");
  EXPECT_EQ(options.auth_key_length().value(), 32u);
  EXPECT_EQ(options.salt_length().value(), 4u);
}

TEST(TransferManagerOptionsTest, WithDefaultValuesReadsEnvironment)
{
  ::unsetenv("VOLTX_TRANSFER_KEY_LENGTH");
  ::unsetenv("VOLTX_TRANSFER_SALT_LENGTH");
  {
    TransferManagerOptions options = TransferManagerOptions::with_default_values();
    EXPECT_EQ(options.auth_key_length().value(), 16u);
    EXPECT_EQ(options.salt_length().value(), 8u);
  }

  ::setenv("VOLTX_TRANSFER_KEY_LENGTH", "24", /*overwrite=*/1);
  ::setenv("VOLTX_TRANSFER_SALT_LENGTH", "12", /*overwrite=*/1);
  {
    TransferManagerOptions options = TransferManagerOptions::with_default_values();
    EXPECT_EQ(options.auth_key_length().value(), 24u);
    EXPECT_EQ(options.salt_length().value(), 12u);
  }
  ::unsetenv("VOLTX_TRANSFER_KEY_LENGTH");
  ::unsetenv("VOLTX_TRANSFER_SALT_LENGTH");
}

TEST(TransferManagerOptionsTest, OutOfRangeLengthsFallBackToDefaults)
{
  TransferManagerOptions options;

  for (voltx::usize length : {voltx::usize{0}, voltx::usize{1}, voltx::usize{3}, voltx::usize{7},
                              voltx::kMaxPasswordLength + 1, ~voltx::usize{0}}) {
    options.set_auth_key_length(length);
    EXPECT_EQ(options.auth_key_length().value(), voltx::kDefaultTransferAuthKeyLength)
        << BATT_INSPECT(length);
  }

  options.set_auth_key_length(voltx::kMinTransferAuthKeyLength);
  EXPECT_EQ(options.auth_key_length().value(), voltx::kMinTransferAuthKeyLength);

  options.set_auth_key_length(voltx::kMaxPasswordLength);
  EXPECT_EQ(options.auth_key_length().value(), voltx::kMaxPasswordLength);

  options.set_salt_length(0);
  EXPECT_EQ(options.salt_length().value(), voltx::kDefaultTransferSaltLength);

  options.set_salt_length(voltx::kMaxPasswordLength + 1);
  EXPECT_EQ(options.salt_length().value(), voltx::kDefaultTransferSaltLength);

  options.set_salt_length(1);
  EXPECT_EQ(options.salt_length().value(), 1u);
}

TEST(TransferManagerOptionsTest, WithDefaultValuesRejectsShortKeyLength)
{
  for (const char* value : {"0", "3", "100000"}) {
    ::setenv("VOLTX_TRANSFER_KEY_LENGTH", value, /*overwrite=*/1);
    ::setenv("VOLTX_TRANSFER_SALT_LENGTH", "0", /*overwrite=*/1);

    TransferManagerOptions options = TransferManagerOptions::with_default_values();

    EXPECT_EQ(options.auth_key_length().value(), voltx::kDefaultTransferAuthKeyLength)
        << BATT_INSPECT(value);
    EXPECT_EQ(options.salt_length().value(), voltx::kDefaultTransferSaltLength);
  }
  ::unsetenv("VOLTX_TRANSFER_KEY_LENGTH");
  ::unsetenv("VOLTX_TRANSFER_SALT_LENGTH");
}

}  // namespace
