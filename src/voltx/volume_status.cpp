//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/volume_status.hpp>
//

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string_view to_string_view(VolumeStatus status) noexcept
{
  switch (status) {
    case VolumeStatus::kCreating:
      return "creating";
    case VolumeStatus::kAvailable:
      return "available";
    case VolumeStatus::kAttaching:
      return "attaching";
    case VolumeStatus::kInUse:
      return "in-use";
    case VolumeStatus::kDetaching:
      return "detaching";
    case VolumeStatus::kMaintenance:
      return "maintenance";
    case VolumeStatus::kDeleting:
      return "deleting";
    case VolumeStatus::kAwaitingTransfer:
      return "awaiting-transfer";
    case VolumeStatus::kBackingUp:
      return "backing-up";
    case VolumeStatus::kRestoringBackup:
      return "restoring-backup";
    case VolumeStatus::kError:
      return "error";
    case VolumeStatus::kErrorDeleting:
      return "error_deleting";
    case VolumeStatus::kErrorRestoring:
      return "error_restoring";
    case VolumeStatus::kErrorExtending:
      return "error_extending";
    case VolumeStatus::kExtending:
      return "extending";
    case VolumeStatus::kRetyping:
      return "retyping";
    case VolumeStatus::kUploading:
      return "uploading";
    case VolumeStatus::kDownloading:
      return "downloading";
  }
  return "(unknown)";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<VolumeStatus> parse_volume_status(std::string_view name)
{
  for (VolumeStatus status : kAllVolumeStatuses) {
    if (to_string_view(status) == name) {
      return status;
    }
  }
  return make_status(StatusCode::kInvalidVolumeStatusString);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, VolumeStatus t)
{
  return out << to_string_view(t);
}

}  // namespace voltx
