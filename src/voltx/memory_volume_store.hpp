//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_MEMORY_VOLUME_STORE_HPP
#define VOLTX_MEMORY_VOLUME_STORE_HPP

#include <voltx/config.hpp>
//
#include <voltx/volume_store.hpp>

#include <batteries/async/mutex.hpp>

#include <atomic>
#include <map>
#include <string>

namespace voltx {

/** \brief VolumeStore held entirely in memory, guarded by a single mutex.
 */
class MemoryVolumeStore : public VolumeStore
{
 public:
  struct State {
    std::map<std::string, VolumeRecord, std::less<>> volumes_;
    std::map<std::string, VolumeMetadata, std::less<>> metadata_;
    std::map<std::string, VolumeMetadata, std::less<>> admin_metadata_;
    std::map<std::string, VolumeTypeRecord, std::less<>> volume_types_;
    std::map<std::string, TransferRecord, std::less<>> transfers_;

    // volume_id => transfer_id, for the single live transfer of each volume.
    //
    std::map<std::string, std::string, std::less<>> transfer_by_volume_;

    /** \brief Removes the transfer (if present) and its volume index entry.  Returns true iff
     * something was removed.
     */
    bool erase_transfer(std::string_view transfer_id);
  };

  MemoryVolumeStore() = default;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  Status create_volume(const VolumeRecord& volume) override;

  StatusOr<VolumeRecord> get_volume(std::string_view volume_id) override;

  std::vector<VolumeRecord> get_volumes_by_project(std::string_view project_id) override;

  StatusOr<bool> conditional_update(std::string_view volume_id, VolumeStatus expected_status,
                                    const VolumeUpdate& update) override;

  Status destroy_volume(std::string_view volume_id) override;

  StatusOr<VolumeMetadata> get_volume_metadata(std::string_view volume_id) override;

  Status set_volume_metadata(std::string_view volume_id, const VolumeMetadata& metadata) override;

  StatusOr<VolumeMetadata> get_volume_admin_metadata(std::string_view volume_id) override;

  Status set_volume_admin_metadata(std::string_view volume_id,
                                   const VolumeMetadata& metadata) override;

  Status create_volume_type(const VolumeTypeRecord& volume_type) override;

  StatusOr<VolumeTypeRecord> get_volume_type(std::string_view volume_type_id) override;

  StatusOr<TransferRecord> create_transfer(const TransferRecord& transfer) override;

  StatusOr<TransferRecord> get_transfer(std::string_view transfer_id) override;

  std::vector<TransferRecord> get_all_transfers() override;

  Status destroy_transfer(std::string_view transfer_id) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief The number of metadata lookups served so far (both kinds); used to observe lazy
   * loading.
   */
  u64 metadata_fetch_count() const
  {
    return this->metadata_fetch_count_.load();
  }

 private:
  batt::Mutex<State> state_;

  std::atomic<u64> metadata_fetch_count_{0};
};

}  // namespace voltx

#endif  // VOLTX_MEMORY_VOLUME_STORE_HPP
