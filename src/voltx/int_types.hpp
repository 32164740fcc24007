//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_INT_TYPES_HPP
#define VOLTX_INT_TYPES_HPP

#include <batteries/int_types.hpp>

namespace voltx {

namespace int_types {

using namespace batt::int_types;

}  // namespace int_types

using namespace int_types;

}  // namespace voltx

#endif  // VOLTX_INT_TYPES_HPP
