//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/notification_sink.hpp>
//

#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ VolumeUsagePayload VolumeUsagePayload::from_record(const VolumeRecord& volume)
{
  return VolumeUsagePayload{
      .volume_id = volume.id,
      .project_id = volume.project_id,
      .user_id = volume.user_id,
      .volume_type_id = volume.volume_type_id,
      .display_name = volume.display_name,
      .size = volume.size,
      .status = volume.status,
      .created_at = volume.created_at,
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const VolumeUsagePayload& t)
{
  return out << "VolumeUsagePayload{.volume_id=" << t.volume_id << ", .project_id=" << t.project_id
             << ", .user_id=" << t.user_id << ", .volume_type_id=" << t.volume_type_id
             << ", .display_name=" << batt::c_str_literal(t.display_name) << ", .size=" << t.size
             << ", .status=" << t.status << ",}";
}

}  // namespace voltx
