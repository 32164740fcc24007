//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/memory_volume_store.hpp>
//
#include <voltx/memory_volume_store.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using voltx::MemoryVolumeStore;
using voltx::StatusCode;
using voltx::TransferRecord;
using voltx::VolumeRecord;
using voltx::VolumeStatus;
using voltx::VolumeUpdate;

class MemoryVolumeStoreTest : public ::testing::Test
{
 public:
  void SetUp() override
  {
    ASSERT_TRUE(this->store.create_volume_type(voltx::VolumeTypeRecord{
                                                   .id = "type-1",
                                                   .name = "gold",
                                               })
                    .ok());
  }

  VolumeRecord make_volume(const std::string& id, VolumeStatus status = VolumeStatus::kAvailable)
  {
    VolumeRecord volume;
    volume.id = id;
    volume.status = status;
    volume.project_id = "project-a";
    volume.user_id = "user-a";
    volume.size = 5;
    return volume;
  }

  TransferRecord make_transfer(const std::string& id, const std::string& volume_id)
  {
    TransferRecord transfer;
    transfer.id = id;
    transfer.volume_id = volume_id;
    transfer.display_name = "xfer";
    transfer.salt = "salt";
    transfer.crypt_hash = voltx::compute_sha256(batt::ConstBuffer{"x", 1});
    return transfer;
  }

  MemoryVolumeStore store;
};

TEST_F(MemoryVolumeStoreTest, CreateAndGetVolume)
{
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v1")).ok());

  batt::StatusOr<VolumeRecord> volume = this->store.get_volume("v1");
  ASSERT_TRUE(volume.ok());
  EXPECT_EQ(volume->id, "v1");
  EXPECT_EQ(volume->status, VolumeStatus::kAvailable);
  EXPECT_EQ(volume->project_id, "project-a");
  EXPECT_EQ(volume->size, 5);
  EXPECT_EQ(volume->name(), "volume-v1");
  EXPECT_EQ(volume->created_at, volume->updated_at);

  EXPECT_TRUE(voltx::status_is(this->store.create_volume(this->make_volume("v1")),
                               StatusCode::kVolumeAlreadyExists));
  EXPECT_TRUE(
      voltx::status_is(this->store.get_volume("v2").status(), StatusCode::kVolumeNotFound));
}

TEST_F(MemoryVolumeStoreTest, CreateVolumeWithUnknownType)
{
  VolumeRecord volume = this->make_volume("v1");
  volume.volume_type_id = "no-such-type";

  EXPECT_TRUE(
      voltx::status_is(this->store.create_volume(volume), StatusCode::kVolumeTypeNotFound));

  volume.volume_type_id = "type-1";
  EXPECT_TRUE(this->store.create_volume(volume).ok());
}

TEST_F(MemoryVolumeStoreTest, GetVolumesByProject)
{
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v1")).ok());
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v2")).ok());
  {
    VolumeRecord other = this->make_volume("v3");
    other.project_id = "project-b";
    ASSERT_TRUE(this->store.create_volume(other).ok());
  }

  EXPECT_EQ(this->store.get_volumes_by_project("project-a").size(), 2u);
  EXPECT_EQ(this->store.get_volumes_by_project("project-b").size(), 1u);
  EXPECT_EQ(this->store.get_volumes_by_project("project-c").size(), 0u);
}

TEST_F(MemoryVolumeStoreTest, ConditionalUpdate)
{
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v1")).ok());

  // Status mismatch: nothing changes.
  //
  batt::StatusOr<bool> result = this->store.conditional_update(
      "v1", VolumeStatus::kAwaitingTransfer,
      VolumeUpdate{.status = VolumeStatus::kAvailable, .project_id = std::string{"project-b"}});
  ASSERT_TRUE(result.ok());
  EXPECT_FALSE(*result);
  EXPECT_EQ(this->store.get_volume("v1")->project_id, "project-a");

  // Match: status and tenancy updated together.
  //
  result = this->store.conditional_update("v1", VolumeStatus::kAvailable,
                                          VolumeUpdate{
                                              .status = VolumeStatus::kAwaitingTransfer,
                                              .project_id = std::string{"project-b"},
                                              .user_id = std::string{"user-b"},
                                          });
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(*result);

  batt::StatusOr<VolumeRecord> volume = this->store.get_volume("v1");
  ASSERT_TRUE(volume.ok());
  EXPECT_EQ(volume->status, VolumeStatus::kAwaitingTransfer);
  EXPECT_EQ(volume->project_id, "project-b");
  EXPECT_EQ(volume->user_id, "user-b");
  EXPECT_GE(volume->updated_at, volume->created_at);

  EXPECT_TRUE(voltx::status_is(
      this->store.conditional_update("nope", VolumeStatus::kAvailable, VolumeUpdate{}).status(),
      StatusCode::kVolumeNotFound));
}

TEST_F(MemoryVolumeStoreTest, OneLiveTransferPerVolume)
{
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v1")).ok());

  batt::StatusOr<TransferRecord> t1 = this->store.create_transfer(this->make_transfer("t1", "v1"));
  ASSERT_TRUE(t1.ok());
  EXPECT_EQ(t1->id, "t1");

  EXPECT_TRUE(voltx::status_is(this->store.create_transfer(this->make_transfer("t2", "v1")).status(),
                               StatusCode::kTransferAlreadyExists));
  EXPECT_TRUE(voltx::status_is(this->store.create_transfer(this->make_transfer("t3", "v9")).status(),
                               StatusCode::kVolumeNotFound));

  ASSERT_TRUE(this->store.destroy_transfer("t1").ok());
  EXPECT_TRUE(
      voltx::status_is(this->store.get_transfer("t1").status(), StatusCode::kTransferNotFound));
  EXPECT_TRUE(
      voltx::status_is(this->store.destroy_transfer("t1"), StatusCode::kTransferNotFound));

  // The volume is free for a new transfer once the old one is gone.
  //
  EXPECT_TRUE(this->store.create_transfer(this->make_transfer("t2", "v1")).ok());
  EXPECT_EQ(this->store.get_all_transfers().size(), 1u);
}

TEST_F(MemoryVolumeStoreTest, DestroyVolumeCascades)
{
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v1")).ok());
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v2")).ok());
  ASSERT_TRUE(this->store.set_volume_metadata("v1", {{"k", "v"}}).ok());
  ASSERT_TRUE(this->store.create_transfer(this->make_transfer("t1", "v1")).ok());
  ASSERT_TRUE(this->store.create_transfer(this->make_transfer("t2", "v2")).ok());

  ASSERT_TRUE(this->store.destroy_volume("v1").ok());

  EXPECT_TRUE(
      voltx::status_is(this->store.get_transfer("t1").status(), StatusCode::kTransferNotFound));
  EXPECT_TRUE(this->store.get_transfer("t2").ok());
  EXPECT_TRUE(voltx::status_is(this->store.get_volume_metadata("v1").status(),
                               StatusCode::kVolumeNotFound));
  EXPECT_TRUE(voltx::status_is(this->store.destroy_volume("v1"), StatusCode::kVolumeNotFound));

  std::vector<TransferRecord> remaining = this->store.get_all_transfers();
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].id, "t2");
}

TEST_F(MemoryVolumeStoreTest, Metadata)
{
  ASSERT_TRUE(this->store.create_volume(this->make_volume("v1")).ok());

  EXPECT_TRUE(this->store.get_volume_metadata("v1")->empty());
  EXPECT_TRUE(this->store.get_volume_admin_metadata("v1")->empty());

  ASSERT_TRUE(this->store.set_volume_metadata("v1", {{"purpose", "db"}}).ok());
  ASSERT_TRUE(this->store.set_volume_admin_metadata("v1", {{"readonly", "True"}}).ok());

  EXPECT_EQ(this->store.get_volume_metadata("v1")->at("purpose"), "db");
  EXPECT_EQ(this->store.get_volume_admin_metadata("v1")->at("readonly"), "True");
  EXPECT_EQ(this->store.metadata_fetch_count(), 4u);

  EXPECT_TRUE(voltx::status_is(this->store.set_volume_metadata("v9", {}),
                               StatusCode::kVolumeNotFound));
}

TEST_F(MemoryVolumeStoreTest, VolumeTypes)
{
  batt::StatusOr<voltx::VolumeTypeRecord> volume_type = this->store.get_volume_type("type-1");
  ASSERT_TRUE(volume_type.ok());
  EXPECT_EQ(volume_type->name, "gold");

  EXPECT_TRUE(voltx::status_is(this->store.create_volume_type(*volume_type),
                               StatusCode::kVolumeTypeAlreadyExists));
  EXPECT_TRUE(voltx::status_is(this->store.get_volume_type("type-2").status(),
                               StatusCode::kVolumeTypeNotFound));
}

}  // namespace
