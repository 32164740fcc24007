//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/quota_ledger_options.hpp>
//

#include <voltx/constants.hpp>
#include <voltx/logging.hpp>

#include <batteries/env.hpp>
#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ QuotaLedgerOptions QuotaLedgerOptions::with_default_values()
{
  QuotaLedgerOptions options;

  options  //
      .set_default_limit(kVolumesResource,
                         batt::getenv_as<i64>("VOLTX_QUOTA_VOLUMES").value_or(kDefaultQuotaVolumes))
      .set_default_limit(
          kGigabytesResource,
          batt::getenv_as<i64>("VOLTX_QUOTA_GIGABYTES").value_or(kDefaultQuotaGigabytes))
      .set_reservation_expire(std::chrono::seconds{
          batt::getenv_as<i64>("VOLTX_RESERVATION_EXPIRE_SECONDS")
              .value_or(kDefaultReservationExpireSeconds)});

  VOLTX_VLOG(1) << "QuotaLedgerOptions::with_default_values() == " << options;

  return options;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
QuotaLedgerOptions& QuotaLedgerOptions::set_default_limit(std::string_view resource, i64 limit)
{
  this->default_limits_[std::string{resource}] = limit;
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
QuotaLedgerOptions& QuotaLedgerOptions::set_reservation_expire(std::chrono::seconds value) noexcept
{
  this->reservation_expire_ = value;
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
i64 QuotaLedgerOptions::default_limit(std::string_view resource) const
{
  auto iter = this->default_limits_.find(resource);
  if (iter == this->default_limits_.end()) {
    return kUnlimitedQuota;
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const QuotaLedgerOptions& t)
{
  out << "QuotaLedgerOptions{.default_limits={";
  for (const auto& [resource, limit] : t.default_limits()) {
    out << resource << ": " << limit << ", ";
  }
  return out << "}, .reservation_expire=" << t.reservation_expire().count() << "s,}";
}

}  // namespace voltx
