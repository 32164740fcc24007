//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/quota_deltas.hpp>
//

#include <voltx/constants.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
QuotaDeltas volume_quota_deltas(i64 size)
{
  return QuotaDeltas{
      {std::string{kVolumesResource}, 1},
      {std::string{kGigabytesResource}, size},
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void add_volume_type_opts(QuotaDeltas* deltas, const Optional<VolumeTypeRecord>& volume_type)
{
  if (!volume_type) {
    return;
  }

  for (std::string_view resource : {kVolumesResource, kGigabytesResource}) {
    auto iter = deltas->find(std::string{resource});
    if (iter != deltas->end()) {
      const i64 amount = iter->second;
      (*deltas)[std::string{resource} + "_" + volume_type->name] = amount;
    }
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
QuotaDeltas negated(const QuotaDeltas& deltas)
{
  QuotaDeltas result;
  for (const auto& [resource, amount] : deltas) {
    result.emplace(resource, -amount);
  }
  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const QuotaDeltas& t)
{
  out << "{";
  for (const auto& [resource, amount] : t) {
    out << resource << ": " << amount << ", ";
  }
  return out << "}";
}

}  // namespace voltx
