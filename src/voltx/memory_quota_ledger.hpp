//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_MEMORY_QUOTA_LEDGER_HPP
#define VOLTX_MEMORY_QUOTA_LEDGER_HPP

#include <voltx/config.hpp>
//
#include <voltx/quota_ledger.hpp>
#include <voltx/quota_ledger_options.hpp>

#include <batteries/async/mutex.hpp>

#include <map>
#include <string>
#include <utility>

namespace voltx {

/** \brief QuotaLedger held in memory.  All counters and reservations are guarded by one mutex.
 */
class MemoryQuotaLedger : public QuotaLedger
{
 public:
  // (project_id, resource)
  //
  using CounterKey = std::pair<std::string, std::string>;

  struct Counter {
    i64 in_use = 0;
    i64 reserved = 0;
  };

  struct Reservation {
    std::string project_id;
    std::string resource;
    i64 delta;
    Timestamp expire;
  };

  struct State {
    std::map<CounterKey, i64> limits_;
    std::map<CounterKey, Counter> counters_;
    std::map<std::string, Reservation> reservations_;
  };

  explicit MemoryQuotaLedger(const QuotaLedgerOptions& options) noexcept;

  const QuotaLedgerOptions& options() const noexcept
  {
    return this->options_;
  }

  /** \brief The number of reservations neither committed nor rolled back yet.
   */
  usize outstanding_reservation_count();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  StatusOr<Reservations> reserve(std::string_view project_id, const QuotaDeltas& deltas) override;

  Status commit(const Reservations& reservations) override;

  Status rollback(const Reservations& reservations) override;

  usize expire_reservations(Timestamp now) override;

  QuotaUsage get_usage(std::string_view project_id, std::string_view resource) override;

  Status set_limit(std::string_view project_id, std::string_view resource, i64 limit) override;

 private:
  enum struct Resolution {
    kCommit,
    kRollback,
  };

  i64 get_limit(const State& state, const CounterKey& key) const;

  // Applies the commit or rollback of every reservation in `reservations`.  Fails without changing
  // anything if any id is unknown.
  //
  Status resolve(const Reservations& reservations, Resolution resolution);

  static void resolve_one(State& state, const Reservation& r, Resolution resolution);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const QuotaLedgerOptions options_;

  batt::Mutex<State> state_;
};

}  // namespace voltx

#endif  // VOLTX_MEMORY_QUOTA_LEDGER_HPP
