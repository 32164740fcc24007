//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/sha256.hpp>
//
#include <voltx/sha256.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

#include <string>
#include <string_view>

namespace {

using voltx::Sha256;

constexpr std::string_view kAbcHash =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(Sha256Test, KnownDigest)
{
  std::string_view data = "abc";
  Sha256 hash = voltx::compute_sha256(batt::ConstBuffer{data.data(), data.size()});

  EXPECT_EQ(batt::to_string(hash), kAbcHash);
}

TEST(Sha256Test, ConstantTimeEqual)
{
  std::string_view a = "a";
  std::string_view b = "b";

  Sha256 hash_a = voltx::compute_sha256(batt::ConstBuffer{a.data(), a.size()});
  Sha256 hash_a2 = voltx::compute_sha256(batt::ConstBuffer{a.data(), a.size()});
  Sha256 hash_b = voltx::compute_sha256(batt::ConstBuffer{b.data(), b.size()});

  EXPECT_TRUE(voltx::constant_time_equal(hash_a, hash_a2));
  EXPECT_FALSE(voltx::constant_time_equal(hash_a, hash_b));
  EXPECT_EQ(hash_a, hash_a2);
  EXPECT_NE(hash_a, hash_b);
}

}  // namespace
