//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/quota_deltas.hpp>
//
#include <voltx/quota_deltas.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using voltx::QuotaDeltas;

TEST(QuotaDeltasTest, VolumeDeltas)
{
  EXPECT_EQ(voltx::volume_quota_deltas(7), (QuotaDeltas{{"volumes", 1}, {"gigabytes", 7}}));
}

TEST(QuotaDeltasTest, AddVolumeTypeOpts)
{
  QuotaDeltas deltas = voltx::volume_quota_deltas(7);

  voltx::add_volume_type_opts(&deltas, voltx::None);
  EXPECT_EQ(deltas.size(), 2u);

  voltx::add_volume_type_opts(&deltas, voltx::VolumeTypeRecord{.id = "t1", .name = "gold"});
  EXPECT_EQ(deltas, (QuotaDeltas{
                        {"volumes", 1},
                        {"gigabytes", 7},
                        {"volumes_gold", 1},
                        {"gigabytes_gold", 7},
                    }));
}

TEST(QuotaDeltasTest, Negated)
{
  QuotaDeltas deltas = voltx::volume_quota_deltas(3);
  voltx::add_volume_type_opts(&deltas, voltx::VolumeTypeRecord{.id = "t1", .name = "ssd"});

  EXPECT_EQ(voltx::negated(deltas), (QuotaDeltas{
                                        {"volumes", -1},
                                        {"gigabytes", -3},
                                        {"volumes_ssd", -1},
                                        {"gigabytes_ssd", -3},
                                    }));
  EXPECT_EQ(voltx::negated(voltx::negated(deltas)), deltas);
}

}  // namespace
