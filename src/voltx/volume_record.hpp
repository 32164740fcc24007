//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_VOLUME_RECORD_HPP
#define VOLTX_VOLUME_RECORD_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/volume_status.hpp>

#include <ostream>
#include <string>

namespace voltx {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A volume as persisted by the VolumeStore.
 */
struct VolumeRecord {
  std::string id;
  VolumeStatus status = VolumeStatus::kCreating;
  std::string project_id;
  std::string user_id;

  // Empty if the volume has no type.
  //
  std::string volume_type_id;

  // Size in GiB.
  //
  i64 size = 0;

  std::string display_name;
  Timestamp created_at;
  Timestamp updated_at;

  /** \brief The backend name of the volume ("volume-<id>").
   */
  std::string name() const
  {
    return "volume-" + this->id;
  }
};

std::ostream& operator<<(std::ostream& out, const VolumeRecord& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief The set of fields a conditional update writes; unset fields are left unchanged.
 */
struct VolumeUpdate {
  Optional<VolumeStatus> status;
  Optional<std::string> project_id;
  Optional<std::string> user_id;

  /** \brief Writes the set fields into `record`.  Does not touch `updated_at`.
   */
  void apply_to(VolumeRecord* record) const;
};

std::ostream& operator<<(std::ostream& out, const VolumeUpdate& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A volume type; its name qualifies the per-type quota resources.
 */
struct VolumeTypeRecord {
  std::string id;
  std::string name;
};

inline bool operator==(const VolumeTypeRecord& l, const VolumeTypeRecord& r)
{
  return l.id == r.id && l.name == r.name;
}

std::ostream& operator<<(std::ostream& out, const VolumeTypeRecord& t);

}  // namespace voltx

#endif  // VOLTX_VOLUME_RECORD_HPP
