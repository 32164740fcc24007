//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/volume_record.hpp>
//

#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const VolumeRecord& t)
{
  return out << "VolumeRecord{.id=" << t.id << ", .status=" << t.status
             << ", .project_id=" << t.project_id << ", .user_id=" << t.user_id
             << ", .volume_type_id=" << batt::c_str_literal(t.volume_type_id)
             << ", .size=" << t.size << ", .display_name=" << batt::c_str_literal(t.display_name)
             << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void VolumeUpdate::apply_to(VolumeRecord* record) const
{
  if (this->status) {
    record->status = *this->status;
  }
  if (this->project_id) {
    record->project_id = *this->project_id;
  }
  if (this->user_id) {
    record->user_id = *this->user_id;
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const VolumeUpdate& t)
{
  return out << "VolumeUpdate{.status=" << t.status << ", .project_id=" << t.project_id
             << ", .user_id=" << t.user_id << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const VolumeTypeRecord& t)
{
  return out << "VolumeTypeRecord{.id=" << t.id << ", .name=" << t.name << ",}";
}

}  // namespace voltx
