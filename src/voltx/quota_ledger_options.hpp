//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_QUOTA_LEDGER_OPTIONS_HPP
#define VOLTX_QUOTA_LEDGER_OPTIONS_HPP

#include <voltx/config.hpp>
//
#include <voltx/int_types.hpp>

#include <chrono>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace voltx {

class QuotaLedgerOptions
{
 public:
  using Self = QuotaLedgerOptions;

  /** \brief Returns the built-in defaults ("volumes" = 10, "gigabytes" = 1000, every other
   * resource unlimited, reservations expire after one day), overridden by the environment
   * variables VOLTX_QUOTA_VOLUMES, VOLTX_QUOTA_GIGABYTES and VOLTX_RESERVATION_EXPIRE_SECONDS where
   * they are set.
   */
  static QuotaLedgerOptions with_default_values();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  //----- --- -- -  -  -   -
  // (setters - begin)

  Self& set_default_limit(std::string_view resource, i64 limit);

  Self& set_reservation_expire(std::chrono::seconds value) noexcept;

  // (setters - end)
  //----- --- -- -  -  -   -

  /** \brief The limit that applies to `resource` for projects with no override; kUnlimitedQuota if
   * none was configured.
   */
  i64 default_limit(std::string_view resource) const;

  std::chrono::seconds reservation_expire() const noexcept
  {
    return this->reservation_expire_;
  }

  const std::map<std::string, i64, std::less<>>& default_limits() const noexcept
  {
    return this->default_limits_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

 private:
  // Per-resource limits applied to every project without an explicit override.
  //
  std::map<std::string, i64, std::less<>> default_limits_;

  // How long an uncommitted reservation is held before expire_reservations reclaims it.
  //
  std::chrono::seconds reservation_expire_{kDefaultReservationExpireSeconds};
};

std::ostream& operator<<(std::ostream& out, const QuotaLedgerOptions& t);

}  // namespace voltx

#endif  // VOLTX_QUOTA_LEDGER_OPTIONS_HPP
