//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/transfer_record.hpp>
//

#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const TransferRecord& t)
{
  // Never print the salt or hash.
  //
  return out << "TransferRecord{.id=" << t.id << ", .volume_id=" << t.volume_id
             << ", .display_name=" << batt::c_str_literal(t.display_name) << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ TransferSummary TransferSummary::from_record(const TransferRecord& record)
{
  return TransferSummary{
      .id = record.id,
      .volume_id = record.volume_id,
      .display_name = record.display_name,
      .created_at = record.created_at,
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const TransferSummary& t)
{
  return out << "TransferSummary{.id=" << t.id << ", .volume_id=" << t.volume_id
             << ", .display_name=" << batt::c_str_literal(t.display_name) << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const TransferAcceptResult& t)
{
  return out << "TransferAcceptResult{.id=" << t.id << ", .volume_id=" << t.volume_id
             << ", .display_name=" << batt::c_str_literal(t.display_name) << ",}";
}

}  // namespace voltx
