//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/sha256.hpp>
//

#include <batteries/stream_util.hpp>

#include <iomanip>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Sha256& t)
{
  for (u8 next_byte : t.bytes) {
    out << batt::to_string(std::hex, std::setw(2), std::setfill('0'), (int)next_byte);
  }
  return out;
}

}  //namespace voltx
