//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_QUOTA_LEDGER_HPP
#define VOLTX_QUOTA_LEDGER_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/quota_deltas.hpp>
#include <voltx/status.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace voltx {

/** \brief Handle to the reservations made by a single QuotaLedger::reserve call; pass it to
 * commit or rollback exactly once.
 */
struct Reservations {
  std::string project_id;
  std::vector<std::string> ids;
};

std::ostream& operator<<(std::ostream& out, const Reservations& t);

/** \brief Snapshot of one resource counter of one project.
 */
struct QuotaUsage {
  i64 in_use = 0;
  i64 reserved = 0;

  // kUnlimitedQuota (-1) means no limit.
  //
  i64 limit = kUnlimitedQuota;
};

inline bool operator==(const QuotaUsage& l, const QuotaUsage& r)
{
  return l.in_use == r.in_use && l.reserved == r.reserved && l.limit == r.limit;
}

std::ostream& operator<<(std::ostream& out, const QuotaUsage& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief Per-project resource counters with two-phase (reserve, then commit or rollback) updates.
 *
 * A positive delta is held as `reserved` until commit moves it into `in_use`; a negative delta
 * does not touch the counters until commit, at which point `in_use` is reduced.  Only positive
 * deltas are checked against the project's limit: a reserve fails if for any resource
 * `in_use + reserved + delta > limit` (limit >= 0), and in that case nothing is reserved.
 *
 * Over-limit errors: kVolumeSizeExceedsAvailableQuota if a "gigabytes*" resource is over,
 * otherwise kVolumeLimitExceeded if a "volumes*" resource is over, otherwise kOverQuota.
 */
class QuotaLedger
{
 public:
  QuotaLedger(const QuotaLedger&) = delete;
  QuotaLedger& operator=(const QuotaLedger&) = delete;

  virtual ~QuotaLedger() = default;

  virtual StatusOr<Reservations> reserve(std::string_view project_id,
                                         const QuotaDeltas& deltas) = 0;

  virtual Status commit(const Reservations& reservations) = 0;

  virtual Status rollback(const Reservations& reservations) = 0;

  /** \brief Rolls back every outstanding reservation whose expiry is at or before `now`.
   *
   * \return the number of reservations rolled back
   */
  virtual usize expire_reservations(Timestamp now) = 0;

  virtual QuotaUsage get_usage(std::string_view project_id, std::string_view resource) = 0;

  /** \brief Overrides the default limit of `resource` for one project.
   */
  virtual Status set_limit(std::string_view project_id, std::string_view resource, i64 limit) = 0;

 protected:
  QuotaLedger() = default;
};

}  // namespace voltx

#endif  // VOLTX_QUOTA_LEDGER_HPP
