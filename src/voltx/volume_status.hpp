//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_VOLUME_STATUS_HPP
#define VOLTX_VOLUME_STATUS_HPP

#include <voltx/config.hpp>
//
#include <voltx/status.hpp>

#include <array>
#include <ostream>
#include <string_view>

namespace voltx {

// The lifecycle status of a volume.  Only kAvailable and kAwaitingTransfer are driven by the
// transfer engine; the rest belong to the volume subsystem and are treated as "not eligible".
//
enum struct VolumeStatus {
  kCreating,
  kAvailable,
  kAttaching,
  kInUse,
  kDetaching,
  kMaintenance,
  kDeleting,
  kAwaitingTransfer,
  kBackingUp,
  kRestoringBackup,
  kError,
  kErrorDeleting,
  kErrorRestoring,
  kErrorExtending,
  kExtending,
  kRetyping,
  kUploading,
  kDownloading,
};

constexpr std::array<VolumeStatus, 18> kAllVolumeStatuses = {
    VolumeStatus::kCreating,       VolumeStatus::kAvailable,       VolumeStatus::kAttaching,
    VolumeStatus::kInUse,          VolumeStatus::kDetaching,       VolumeStatus::kMaintenance,
    VolumeStatus::kDeleting,       VolumeStatus::kAwaitingTransfer, VolumeStatus::kBackingUp,
    VolumeStatus::kRestoringBackup, VolumeStatus::kError,          VolumeStatus::kErrorDeleting,
    VolumeStatus::kErrorRestoring, VolumeStatus::kErrorExtending,  VolumeStatus::kExtending,
    VolumeStatus::kRetyping,       VolumeStatus::kUploading,       VolumeStatus::kDownloading,
};

/** \brief Returns the wire name of the status, e.g. "awaiting-transfer".
 */
std::string_view to_string_view(VolumeStatus status) noexcept;

/** \brief Inverse of to_string_view; unknown names fail with kInvalidVolumeStatusString.
 */
StatusOr<VolumeStatus> parse_volume_status(std::string_view name);

std::ostream& operator<<(std::ostream& out, VolumeStatus t);

}  // namespace voltx

#endif  // VOLTX_VOLUME_STATUS_HPP
