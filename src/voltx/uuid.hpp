//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_UUID_HPP
#define VOLTX_UUID_HPP

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <string>

namespace voltx {

inline decltype(auto) random_uuid()
{
  thread_local boost::uuids::random_generator g;
  return g();
}

// Volume, transfer and reservation ids are the canonical string form of a random uuid.
//
inline std::string random_id()
{
  return boost::uuids::to_string(random_uuid());
}

}  // namespace voltx

#endif  // VOLTX_UUID_HPP
