//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_STATUS_CODE_HPP
#define VOLTX_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace voltx {

enum struct StatusCode {
  kOk = 0,
  kTransferNotFound = 1,
  kInvalidAuthKey = 2,
  kInvalidVolume = 3,
  kVolumeNotFound = 4,
  kVolumeTypeNotFound = 5,
  kVolumeAlreadyExists = 6,
  kVolumeTypeAlreadyExists = 7,
  kTransferAlreadyExists = 8,
  kOverQuota = 9,
  kVolumeLimitExceeded = 10,
  kVolumeSizeExceedsAvailableQuota = 11,
  kReservationNotFound = 12,
  kRandomSourceFailed = 13,
  kInvalidVolumeStatusString = 14,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

}  // namespace voltx

#endif  // VOLTX_STATUS_CODE_HPP
