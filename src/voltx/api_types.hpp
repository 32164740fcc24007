//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_API_TYPES_HPP
#define VOLTX_API_TYPES_HPP

#include <voltx/int_types.hpp>

#include <batteries/optional.hpp>
#include <batteries/strong_typedef.hpp>

#include <chrono>
#include <map>
#include <string>

namespace voltx {

using ::batt::make_optional;
using ::batt::None;
using ::batt::Optional;

/** \brief Wall-clock timestamps recorded on volumes, transfers and reservations.
 */
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/** \brief Free-form key/value metadata attached to a volume.
 */
using VolumeMetadata = std::map<std::string, std::string>;

/** \brief The number of characters in a generated password (auth key or salt).
 */
BATT_STRONG_TYPEDEF(usize, PasswordLength);

}  // namespace voltx

#endif  // VOLTX_API_TYPES_HPP
