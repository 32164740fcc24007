//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/status_code.hpp>
//

#include <batteries/status.hpp>

namespace voltx {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),  // 0
      CODE_WITH_MSG_(StatusCode::kTransferNotFound,
                     "Transfer could not be found"),  // 1
      CODE_WITH_MSG_(StatusCode::kInvalidAuthKey,
                     "Invalid auth key: the key does not match the transfer"),  // 2
      CODE_WITH_MSG_(StatusCode::kInvalidVolume,
                     "Invalid volume: the volume is not in the status required by the "
                     "operation"),  // 3
      CODE_WITH_MSG_(StatusCode::kVolumeNotFound, "Volume could not be found"),            // 4
      CODE_WITH_MSG_(StatusCode::kVolumeTypeNotFound, "Volume type could not be found"),   // 5
      CODE_WITH_MSG_(StatusCode::kVolumeAlreadyExists, "A volume with this id exists"),    // 6
      CODE_WITH_MSG_(StatusCode::kVolumeTypeAlreadyExists,
                     "A volume type with this id exists"),  // 7
      CODE_WITH_MSG_(StatusCode::kTransferAlreadyExists,
                     "The volume already has a pending transfer, or a transfer with this id "
                     "exists"),  // 8
      CODE_WITH_MSG_(StatusCode::kOverQuota,
                     "Quota exceeded for one or more resources"),  // 9
      CODE_WITH_MSG_(StatusCode::kVolumeLimitExceeded,
                     "Maximum number of volumes allowed for the project exceeded"),  // 10
      CODE_WITH_MSG_(StatusCode::kVolumeSizeExceedsAvailableQuota,
                     "Requested volume size exceeds the available gigabytes quota"),  // 11
      CODE_WITH_MSG_(StatusCode::kReservationNotFound,
                     "Quota reservation could not be found (committed, rolled back or "
                     "expired)"),  // 12
      CODE_WITH_MSG_(StatusCode::kRandomSourceFailed,
                     "The cryptographic random source failed to produce bytes"),  // 13
      CODE_WITH_MSG_(StatusCode::kInvalidVolumeStatusString,
                     "The string does not name a known volume status"),  // 14
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

}  // namespace voltx
