//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_VOLUME_HPP
#define VOLTX_VOLUME_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/request_context.hpp>
#include <voltx/status.hpp>
#include <voltx/volume_record.hpp>
#include <voltx/volume_store.hpp>

#include <bitset>
#include <ostream>
#include <string_view>

namespace voltx {

/** \brief Optional groups of volume fields that are fetched from the store on first access.
 */
enum struct VolumeFieldGroup : usize {
  kMetadata = 0,
  kAdminMetadata = 1,
  kVolumeType = 2,
};

constexpr usize kNumVolumeFieldGroups = 3;

std::ostream& operator<<(std::ostream& out, VolumeFieldGroup t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A volume record loaded on behalf of a particular request context, with explicitly
 * lazy-loaded field groups.
 *
 * The core record is read eagerly by get_by_id.  Each VolumeFieldGroup is fetched from the store
 * the first time it is asked for and then served from this object until refresh() is called.
 * Admin metadata is only ever fetched for admin contexts; other contexts see an empty map and no
 * store access happens.
 *
 * Not thread-safe; a Volume is meant to live for the duration of a single request.
 */
class Volume
{
 public:
  /** \brief Loads the volume, enforcing visibility: a non-admin context sees only volumes owned by
   * its project.  Missing or invisible volumes fail with kVolumeNotFound.
   */
  static StatusOr<Volume> get_by_id(const RequestContext& context, VolumeStore& store,
                                    std::string_view volume_id);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const VolumeRecord& record() const noexcept
  {
    return this->record_;
  }

  const std::string& id() const noexcept
  {
    return this->record_.id;
  }

  VolumeStatus status() const noexcept
  {
    return this->record_.status;
  }

  std::string name() const
  {
    return this->record_.name();
  }

  bool is_loaded(VolumeFieldGroup group) const noexcept
  {
    return this->loaded_[static_cast<usize>(group)];
  }

  StatusOr<VolumeMetadata> metadata();

  StatusOr<VolumeMetadata> admin_metadata();

  /** \brief The volume's type, or None if the volume is untyped.
   */
  StatusOr<Optional<VolumeTypeRecord>> volume_type();

  /** \brief Re-reads the core record and forgets every loaded field group.
   */
  Status refresh();

  /** \brief Destroys the volume in the store (which cascades to its transfers).
   */
  Status destroy();

 private:
  explicit Volume(const RequestContext& context, VolumeStore& store, VolumeRecord&& record) noexcept;

  void set_loaded(VolumeFieldGroup group)
  {
    this->loaded_.set(static_cast<usize>(group));
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  RequestContext context_;
  VolumeStore* store_;
  VolumeRecord record_;
  std::bitset<kNumVolumeFieldGroups> loaded_;
  VolumeMetadata metadata_;
  VolumeMetadata admin_metadata_;
  Optional<VolumeTypeRecord> volume_type_;
};

std::ostream& operator<<(std::ostream& out, const Volume& t);

}  // namespace voltx

#endif  // VOLTX_VOLUME_HPP
