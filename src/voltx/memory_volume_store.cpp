//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/memory_volume_store.hpp>
//

#include <voltx/logging.hpp>

#include <batteries/assert.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool MemoryVolumeStore::State::erase_transfer(std::string_view transfer_id)
{
  auto iter = this->transfers_.find(transfer_id);
  if (iter == this->transfers_.end()) {
    return false;
  }

  auto index_iter = this->transfer_by_volume_.find(iter->second.volume_id);
  if (index_iter != this->transfer_by_volume_.end() && index_iter->second == iter->first) {
    this->transfer_by_volume_.erase(index_iter);
  }
  this->transfers_.erase(iter);

  return true;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::create_volume(const VolumeRecord& volume)
{
  auto locked = this->state_.lock();

  if (locked->volumes_.count(volume.id) != 0) {
    return make_status(StatusCode::kVolumeAlreadyExists);
  }
  if (!volume.volume_type_id.empty() && locked->volume_types_.count(volume.volume_type_id) == 0) {
    return make_status(StatusCode::kVolumeTypeNotFound);
  }

  VolumeRecord& stored = locked->volumes_[volume.id];
  stored = volume;
  stored.created_at = Clock::now();
  stored.updated_at = stored.created_at;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeRecord> MemoryVolumeStore::get_volume(std::string_view volume_id)
{
  auto locked = this->state_.lock();

  auto iter = locked->volumes_.find(volume_id);
  if (iter == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::vector<VolumeRecord> MemoryVolumeStore::get_volumes_by_project(std::string_view project_id)
{
  std::vector<VolumeRecord> result;

  auto locked = this->state_.lock();
  for (const auto& [id, volume] : locked->volumes_) {
    if (volume.project_id == project_id) {
      result.emplace_back(volume);
    }
  }

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> MemoryVolumeStore::conditional_update(std::string_view volume_id,
                                                     VolumeStatus expected_status,
                                                     const VolumeUpdate& update)
{
  auto locked = this->state_.lock();

  auto iter = locked->volumes_.find(volume_id);
  if (iter == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }

  VolumeRecord& volume = iter->second;
  if (volume.status != expected_status) {
    VOLTX_VLOG(1) << "conditional_update lost;" << BATT_INSPECT(volume_id)
                  << BATT_INSPECT(expected_status) << BATT_INSPECT(volume.status);
    return false;
  }

  update.apply_to(&volume);
  volume.updated_at = Clock::now();

  return true;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::destroy_volume(std::string_view volume_id)
{
  auto locked = this->state_.lock();

  auto iter = locked->volumes_.find(volume_id);
  if (iter == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }

  // Cascade: drop every transfer that references this volume.
  //
  for (auto t_iter = locked->transfers_.begin(); t_iter != locked->transfers_.end();) {
    if (t_iter->second.volume_id == volume_id) {
      t_iter = locked->transfers_.erase(t_iter);
    } else {
      ++t_iter;
    }
  }
  {
    auto index_iter = locked->transfer_by_volume_.find(volume_id);
    if (index_iter != locked->transfer_by_volume_.end()) {
      locked->transfer_by_volume_.erase(index_iter);
    }
  }
  {
    auto md_iter = locked->metadata_.find(volume_id);
    if (md_iter != locked->metadata_.end()) {
      locked->metadata_.erase(md_iter);
    }
    auto admin_iter = locked->admin_metadata_.find(volume_id);
    if (admin_iter != locked->admin_metadata_.end()) {
      locked->admin_metadata_.erase(admin_iter);
    }
  }
  locked->volumes_.erase(iter);

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeMetadata> MemoryVolumeStore::get_volume_metadata(std::string_view volume_id)
{
  this->metadata_fetch_count_.fetch_add(1);

  auto locked = this->state_.lock();

  if (locked->volumes_.find(volume_id) == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  auto iter = locked->metadata_.find(volume_id);
  if (iter == locked->metadata_.end()) {
    return VolumeMetadata{};
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::set_volume_metadata(std::string_view volume_id,
                                              const VolumeMetadata& metadata)
{
  auto locked = this->state_.lock();

  auto iter = locked->volumes_.find(volume_id);
  if (iter == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  locked->metadata_[iter->first] = metadata;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeMetadata> MemoryVolumeStore::get_volume_admin_metadata(std::string_view volume_id)
{
  this->metadata_fetch_count_.fetch_add(1);

  auto locked = this->state_.lock();

  if (locked->volumes_.find(volume_id) == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  auto iter = locked->admin_metadata_.find(volume_id);
  if (iter == locked->admin_metadata_.end()) {
    return VolumeMetadata{};
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::set_volume_admin_metadata(std::string_view volume_id,
                                                    const VolumeMetadata& metadata)
{
  auto locked = this->state_.lock();

  auto iter = locked->volumes_.find(volume_id);
  if (iter == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  locked->admin_metadata_[iter->first] = metadata;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::create_volume_type(const VolumeTypeRecord& volume_type)
{
  auto locked = this->state_.lock();

  const bool inserted = locked->volume_types_.emplace(volume_type.id, volume_type).second;
  if (!inserted) {
    return make_status(StatusCode::kVolumeTypeAlreadyExists);
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeTypeRecord> MemoryVolumeStore::get_volume_type(std::string_view volume_type_id)
{
  auto locked = this->state_.lock();

  auto iter = locked->volume_types_.find(volume_type_id);
  if (iter == locked->volume_types_.end()) {
    return make_status(StatusCode::kVolumeTypeNotFound);
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<TransferRecord> MemoryVolumeStore::create_transfer(const TransferRecord& transfer)
{
  auto locked = this->state_.lock();

  if (locked->volumes_.find(transfer.volume_id) == locked->volumes_.end()) {
    return make_status(StatusCode::kVolumeNotFound);
  }
  if (locked->transfers_.count(transfer.id) != 0 ||
      locked->transfer_by_volume_.count(transfer.volume_id) != 0) {
    return make_status(StatusCode::kTransferAlreadyExists);
  }

  TransferRecord& stored = locked->transfers_[transfer.id];
  stored = transfer;
  stored.created_at = Clock::now();

  locked->transfer_by_volume_[transfer.volume_id] = transfer.id;

  return stored;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<TransferRecord> MemoryVolumeStore::get_transfer(std::string_view transfer_id)
{
  auto locked = this->state_.lock();

  auto iter = locked->transfers_.find(transfer_id);
  if (iter == locked->transfers_.end()) {
    return make_status(StatusCode::kTransferNotFound);
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::vector<TransferRecord> MemoryVolumeStore::get_all_transfers()
{
  std::vector<TransferRecord> result;

  auto locked = this->state_.lock();
  result.reserve(locked->transfers_.size());
  for (const auto& [id, transfer] : locked->transfers_) {
    result.emplace_back(transfer);
  }

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryVolumeStore::destroy_transfer(std::string_view transfer_id)
{
  auto locked = this->state_.lock();

  if (!locked->erase_transfer(transfer_id)) {
    return make_status(StatusCode::kTransferNotFound);
  }
  return OkStatus();
}

}  // namespace voltx
