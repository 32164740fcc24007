//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_TRANSFER_MANAGER_HPP
#define VOLTX_TRANSFER_MANAGER_HPP

#include <voltx/config.hpp>
//
#include <voltx/metrics.hpp>
#include <voltx/notification_sink.hpp>
#include <voltx/quota_ledger.hpp>
#include <voltx/request_context.hpp>
#include <voltx/status.hpp>
#include <voltx/transfer_manager_options.hpp>
#include <voltx/transfer_record.hpp>
#include <voltx/volume_store.hpp>

#include <initializer_list>
#include <string_view>
#include <vector>

namespace voltx {

/** \brief Moves ownership of volumes between projects through one-time, key-protected transfer
 * records.
 *
 * Lifecycle of a volume under transfer:
 *
 *   available --create_transfer--> awaiting-transfer --accept_transfer--> available (new owner)
 *   awaiting-transfer --delete_transfer (or volume destroy)--> available (original owner)
 *
 * Visibility: get_transfer, get_all_transfers and delete_transfer only see transfers whose volume
 * is owned by the caller's project (admin contexts see all).  accept_transfer is not scoped by
 * ownership; knowing the transfer id and auth key is what grants access.
 *
 * All operations may be called concurrently.  The volume status compare-and-set in the
 * VolumeStore is the point of mutual exclusion between competing operations.
 */
class TransferManager
{
 public:
  struct Metrics {
    CountMetric<u64> create_count{0};
    CountMetric<u64> accept_count{0};
    CountMetric<u64> delete_count{0};
    CountMetric<u64> invalid_auth_key_count{0};
    CountMetric<u64> accept_abort_count{0};
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit TransferManager(const TransferManagerOptions& options, VolumeStore& store,
                           QuotaLedger& quota, NotificationSink& notifier) noexcept;

  TransferManager(const TransferManager&) = delete;
  TransferManager& operator=(const TransferManager&) = delete;

  ~TransferManager() noexcept;

  const TransferManagerOptions& options() const noexcept
  {
    return this->options_;
  }

  const Metrics& metrics() const noexcept
  {
    return this->metrics_;
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Locks an `available` volume for transfer and returns the new transfer together with
   * its auth key.  The auth key is not retrievable again.
   *
   * \return kVolumeNotFound if the volume does not exist or is not visible to `context`;
   * kInvalidVolume if the volume is not `available` (including losing a race with another
   * create).
   */
  StatusOr<TransferCreateResult> create_transfer(const RequestContext& context,
                                                 std::string_view volume_id,
                                                 std::string_view display_name);

  /** \return kTransferNotFound if the transfer does not exist or is not visible to `context`.
   */
  StatusOr<TransferSummary> get_transfer(const RequestContext& context,
                                         std::string_view transfer_id);

  std::vector<TransferSummary> get_all_transfers(const RequestContext& context);

  /** \brief Makes the caller's project and user the owner of the transfer's volume, moving the
   * volume's quota usage from the donor project to the caller's.  The transfer is consumed.
   *
   * \return kTransferNotFound if no such transfer exists; kInvalidAuthKey if `auth_key` is wrong;
   * kInvalidVolume if the volume is no longer awaiting transfer; the QuotaLedger's error if the
   * caller's project cannot take the volume.
   */
  StatusOr<TransferAcceptResult> accept_transfer(const RequestContext& context,
                                                 std::string_view transfer_id,
                                                 std::string_view auth_key);

  /** \brief Cancels a transfer and returns its volume to `available` under the original owner.
   *
   * \return kTransferNotFound if the transfer does not exist or is not visible to `context`.
   */
  Status delete_transfer(const RequestContext& context, std::string_view transfer_id);

 private:
  struct VisibleTransfer {
    TransferRecord transfer;
    VolumeRecord volume;
  };

  StatusOr<VisibleTransfer> get_visible_transfer(const RequestContext& context,
                                                 std::string_view transfer_id);

  void notify(const RequestContext& context, const VolumeRecord& volume,
              std::string_view event_name);

  // Best-effort undo of reservations on a failure path.
  //
  void rollback_all(std::initializer_list<const Reservations*> reservations);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const TransferManagerOptions options_;

  VolumeStore& store_;

  QuotaLedger& quota_;

  NotificationSink& notifier_;

  Metrics metrics_;
};

}  // namespace voltx

#endif  // VOLTX_TRANSFER_MANAGER_HPP
