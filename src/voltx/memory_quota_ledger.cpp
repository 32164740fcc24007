//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/memory_quota_ledger.hpp>
//

#include <voltx/constants.hpp>
#include <voltx/logging.hpp>
#include <voltx/uuid.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <vector>

namespace voltx {

namespace {

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

// Maps the set of over-limit resources to the error reported to the caller.
//
Status over_quota_status(const std::vector<std::string>& overs)
{
  for (const std::string& resource : overs) {
    if (starts_with(resource, kGigabytesResource)) {
      return make_status(StatusCode::kVolumeSizeExceedsAvailableQuota);
    }
  }
  for (const std::string& resource : overs) {
    if (starts_with(resource, kVolumesResource)) {
      return make_status(StatusCode::kVolumeLimitExceeded);
    }
  }
  return make_status(StatusCode::kOverQuota);
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
MemoryQuotaLedger::MemoryQuotaLedger(const QuotaLedgerOptions& options) noexcept
    : options_{options}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize MemoryQuotaLedger::outstanding_reservation_count()
{
  return this->state_.lock()->reservations_.size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
i64 MemoryQuotaLedger::get_limit(const State& state, const CounterKey& key) const
{
  auto iter = state.limits_.find(key);
  if (iter != state.limits_.end()) {
    return iter->second;
  }
  return this->options_.default_limit(key.second);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Reservations> MemoryQuotaLedger::reserve(std::string_view project_id,
                                                  const QuotaDeltas& deltas)
{
  Reservations result;
  result.project_id = std::string{project_id};

  const Timestamp expire = Clock::now() + this->options_.reservation_expire();

  auto locked = this->state_.lock();

  // First pass: check every positive delta against its limit; reserve nothing if any is over.
  //
  std::vector<std::string> overs;
  for (const auto& [resource, delta] : deltas) {
    if (delta <= 0) {
      continue;
    }
    const CounterKey key{result.project_id, resource};
    const i64 limit = this->get_limit(*locked, key);
    if (limit < 0) {
      continue;
    }
    const Counter& counter = locked->counters_[key];
    if (counter.in_use + counter.reserved + delta > limit) {
      overs.emplace_back(resource);
    }
  }

  if (!overs.empty()) {
    VOLTX_LOG_REJECTED() << "Quota exceeded;" << BATT_INSPECT(project_id) << BATT_INSPECT(deltas)
                         << BATT_INSPECT_RANGE(overs);
    return over_quota_status(overs);
  }

  // Second pass: record the reservations.
  //
  for (const auto& [resource, delta] : deltas) {
    std::string id = random_id();
    if (delta > 0) {
      locked->counters_[CounterKey{result.project_id, resource}].reserved += delta;
    }
    locked->reservations_.emplace(id, Reservation{
                                          .project_id = result.project_id,
                                          .resource = resource,
                                          .delta = delta,
                                          .expire = expire,
                                      });
    result.ids.emplace_back(std::move(id));
  }

  VOLTX_VLOG(1) << "reserved" << BATT_INSPECT(deltas) << BATT_INSPECT(result);

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryQuotaLedger::commit(const Reservations& reservations)
{
  return this->resolve(reservations, Resolution::kCommit);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryQuotaLedger::rollback(const Reservations& reservations)
{
  return this->resolve(reservations, Resolution::kRollback);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryQuotaLedger::resolve(const Reservations& reservations, Resolution resolution)
{
  auto locked = this->state_.lock();

  for (const std::string& id : reservations.ids) {
    if (locked->reservations_.count(id) == 0) {
      VOLTX_LOG_WARNING() << "Reservation not found (expired?);" << BATT_INSPECT(id)
                          << BATT_INSPECT(reservations);
      return make_status(StatusCode::kReservationNotFound);
    }
  }

  for (const std::string& id : reservations.ids) {
    auto iter = locked->reservations_.find(id);
    BATT_CHECK(iter != locked->reservations_.end());

    resolve_one(*locked, iter->second, resolution);
    locked->reservations_.erase(iter);
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ void MemoryQuotaLedger::resolve_one(State& state, const Reservation& r,
                                               Resolution resolution)
{
  Counter& counter = state.counters_[CounterKey{r.project_id, r.resource}];

  if (r.delta > 0) {
    counter.reserved -= r.delta;
    BATT_CHECK_GE(counter.reserved, 0);
  }
  if (resolution == Resolution::kCommit) {
    counter.in_use += r.delta;
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize MemoryQuotaLedger::expire_reservations(Timestamp now)
{
  usize count = 0;

  auto locked = this->state_.lock();

  for (auto iter = locked->reservations_.begin(); iter != locked->reservations_.end();) {
    if (iter->second.expire <= now) {
      VOLTX_LOG_INFO() << "Expiring reservation;" << BATT_INSPECT(iter->first)
                       << BATT_INSPECT(iter->second.project_id)
                       << BATT_INSPECT(iter->second.resource) << BATT_INSPECT(iter->second.delta);

      resolve_one(*locked, iter->second, Resolution::kRollback);
      iter = locked->reservations_.erase(iter);
      ++count;
    } else {
      ++iter;
    }
  }

  return count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
QuotaUsage MemoryQuotaLedger::get_usage(std::string_view project_id, std::string_view resource)
{
  const CounterKey key{std::string{project_id}, std::string{resource}};

  auto locked = this->state_.lock();

  QuotaUsage usage;
  usage.limit = this->get_limit(*locked, key);

  auto iter = locked->counters_.find(key);
  if (iter != locked->counters_.end()) {
    usage.in_use = iter->second.in_use;
    usage.reserved = iter->second.reserved;
  }

  return usage;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryQuotaLedger::set_limit(std::string_view project_id, std::string_view resource,
                                    i64 limit)
{
  if (limit < kUnlimitedQuota) {
    return {batt::StatusCode::kInvalidArgument};
  }

  auto locked = this->state_.lock();
  locked->limits_[CounterKey{std::string{project_id}, std::string{resource}}] = limit;

  return OkStatus();
}

}  // namespace voltx
