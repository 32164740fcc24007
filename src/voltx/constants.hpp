//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_CONSTANTS_HPP
#define VOLTX_CONSTANTS_HPP

#include <string_view>

namespace voltx {

namespace constants {

// Quota resource names.
//
constexpr std::string_view kVolumesResource = "volumes";
constexpr std::string_view kGigabytesResource = "gigabytes";

}  // namespace constants

using namespace constants;

}  // namespace voltx

#endif  // VOLTX_CONSTANTS_HPP
