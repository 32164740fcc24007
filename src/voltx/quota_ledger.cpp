//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/quota_ledger.hpp>
//

#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Reservations& t)
{
  return out << "Reservations{.project_id=" << batt::c_str_literal(t.project_id)
             << ", .ids=" << batt::dump_range(t.ids) << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const QuotaUsage& t)
{
  return out << "QuotaUsage{.in_use=" << t.in_use << ", .reserved=" << t.reserved
             << ", .limit=" << t.limit << ",}";
}

}  // namespace voltx
