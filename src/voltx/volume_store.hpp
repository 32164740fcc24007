//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_VOLUME_STORE_HPP
#define VOLTX_VOLUME_STORE_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/status.hpp>
#include <voltx/transfer_record.hpp>
#include <voltx/volume_record.hpp>
#include <voltx/volume_status.hpp>

#include <string_view>
#include <vector>

namespace voltx {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief Persistence for volumes, volume types, per-volume metadata and the transfer records that
 * reference volumes.
 *
 * Implementations must make each individual call atomic with respect to all other calls on the
 * same store; multi-call sequences are the caller's responsibility.
 *
 * Error conventions: lookups of missing volumes / volume types / transfers fail with
 * kVolumeNotFound / kVolumeTypeNotFound / kTransferNotFound; inserting a duplicate id fails with
 * the matching k*AlreadyExists code.
 */
class VolumeStore
{
 public:
  VolumeStore(const VolumeStore&) = delete;
  VolumeStore& operator=(const VolumeStore&) = delete;

  virtual ~VolumeStore() = default;

  //----- --- -- -  -  -   -
  // Volumes.
  //----- --- -- -  -  -   -

  /** \brief Inserts a new volume.  `created_at`/`updated_at` are set by the store.
   */
  virtual Status create_volume(const VolumeRecord& volume) = 0;

  virtual StatusOr<VolumeRecord> get_volume(std::string_view volume_id) = 0;

  virtual std::vector<VolumeRecord> get_volumes_by_project(std::string_view project_id) = 0;

  /** \brief Atomically applies `update` to the volume iff its current status equals
   * `expected_status`.
   *
   * \return true if the update was applied, false if the status did not match (the volume is left
   * untouched), or kVolumeNotFound.
   */
  virtual StatusOr<bool> conditional_update(std::string_view volume_id,
                                            VolumeStatus expected_status,
                                            const VolumeUpdate& update) = 0;

  /** \brief Removes the volume together with its metadata and every transfer that references it
   * (cascade delete).
   */
  virtual Status destroy_volume(std::string_view volume_id) = 0;

  virtual StatusOr<VolumeMetadata> get_volume_metadata(std::string_view volume_id) = 0;

  virtual Status set_volume_metadata(std::string_view volume_id, const VolumeMetadata& metadata) = 0;

  virtual StatusOr<VolumeMetadata> get_volume_admin_metadata(std::string_view volume_id) = 0;

  virtual Status set_volume_admin_metadata(std::string_view volume_id,
                                           const VolumeMetadata& metadata) = 0;

  //----- --- -- -  -  -   -
  // Volume types.
  //----- --- -- -  -  -   -

  virtual Status create_volume_type(const VolumeTypeRecord& volume_type) = 0;

  virtual StatusOr<VolumeTypeRecord> get_volume_type(std::string_view volume_type_id) = 0;

  //----- --- -- -  -  -   -
  // Transfers.
  //----- --- -- -  -  -   -

  /** \brief Inserts a transfer record.  Fails with kVolumeNotFound if the referenced volume does
   * not exist, and with kTransferAlreadyExists if the volume already has a live transfer.
   * `created_at` is set by the store.
   */
  virtual StatusOr<TransferRecord> create_transfer(const TransferRecord& transfer) = 0;

  virtual StatusOr<TransferRecord> get_transfer(std::string_view transfer_id) = 0;

  virtual std::vector<TransferRecord> get_all_transfers() = 0;

  virtual Status destroy_transfer(std::string_view transfer_id) = 0;

 protected:
  VolumeStore() = default;
};

}  // namespace voltx

#endif  // VOLTX_VOLUME_STORE_HPP
