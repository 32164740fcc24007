//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/transfer_manager.hpp>
//

#include <voltx/auth_key.hpp>
#include <voltx/logging.hpp>
#include <voltx/quota_deltas.hpp>
#include <voltx/uuid.hpp>
#include <voltx/volume.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <set>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TransferManager::TransferManager(const TransferManagerOptions& options, VolumeStore& store,
                                 QuotaLedger& quota, NotificationSink& notifier) noexcept
    : options_{options}
    , store_{store}
    , quota_{quota}
    , notifier_{notifier}
    , metrics_{}
{
  const auto metric_name = [this](std::string_view property) {
    return batt::to_string("TransferManager_", this->options_.name(), "_", property);
  };

#define ADD_METRIC_(n) global_metric_registry().add(metric_name(#n), this->metrics_.n)

  ADD_METRIC_(create_count);
  ADD_METRIC_(accept_count);
  ADD_METRIC_(delete_count);
  ADD_METRIC_(invalid_auth_key_count);
  ADD_METRIC_(accept_abort_count);

#undef ADD_METRIC_
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TransferManager::~TransferManager() noexcept
{
  global_metric_registry()  //
      .remove(this->metrics_.create_count)
      .remove(this->metrics_.accept_count)
      .remove(this->metrics_.delete_count)
      .remove(this->metrics_.invalid_auth_key_count)
      .remove(this->metrics_.accept_abort_count);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<TransferCreateResult> TransferManager::create_transfer(const RequestContext& context,
                                                                std::string_view volume_id,
                                                                std::string_view display_name)
{
  BATT_ASSIGN_OK_RESULT(Volume volume, Volume::get_by_id(context, this->store_, volume_id));

  if (volume.status() != VolumeStatus::kAvailable) {
    VOLTX_LOG_REJECTED() << "[" << context.request_id() << "] Cannot transfer volume "
                         << volume.id() << "; status must be available, not " << volume.status();
    return make_status(StatusCode::kInvalidVolume);
  }

  BATT_ASSIGN_OK_RESULT(std::string auth_key, generate_password(this->options_.auth_key_length()));
  BATT_ASSIGN_OK_RESULT(std::string salt, generate_password(this->options_.salt_length()));

  this->notify(context, volume.record(), event_names::kTransferCreateStart);

  // Lock the volume.  Only one create can win this for a given volume.
  //
  BATT_ASSIGN_OK_RESULT(const bool locked,
                        this->store_.conditional_update(
                            volume.id(), VolumeStatus::kAvailable,
                            VolumeUpdate{.status = VolumeStatus::kAwaitingTransfer}));
  if (!locked) {
    VOLTX_LOG_REJECTED() << "[" << context.request_id() << "] Volume " << volume.id()
                         << " changed status during create_transfer";
    return make_status(StatusCode::kInvalidVolume);
  }

  TransferRecord record;
  record.id = random_id();
  record.volume_id = volume.id();
  record.display_name = std::string{display_name};
  record.crypt_hash = compute_transfer_crypt_hash(salt, auth_key);
  record.salt = std::move(salt);

  StatusOr<TransferRecord> stored = this->store_.create_transfer(record);
  if (!stored.ok()) {
    VOLTX_LOG_ERROR() << "[" << context.request_id()
                      << "] Failed to persist transfer; unlocking volume" << BATT_INSPECT(record)
                      << BATT_INSPECT(stored.status());

    VOLTX_WARN_IF_NOT_OK(this->store_
                             .conditional_update(volume.id(), VolumeStatus::kAwaitingTransfer,
                                                 VolumeUpdate{.status = VolumeStatus::kAvailable})
                             .status());
    return stored.status();
  }

  VolumeRecord locked_volume = volume.record();
  locked_volume.status = VolumeStatus::kAwaitingTransfer;
  this->notify(context, locked_volume, event_names::kTransferCreateEnd);

  this->metrics_.create_count.add(1);
  VOLTX_VLOG(1) << "[" << context.request_id() << "] Created transfer " << *stored;

  TransferCreateResult result;
  static_cast<TransferSummary&>(result) = TransferSummary::from_record(*stored);
  result.auth_key = std::move(auth_key);

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<TransferSummary> TransferManager::get_transfer(const RequestContext& context,
                                                        std::string_view transfer_id)
{
  BATT_ASSIGN_OK_RESULT(VisibleTransfer visible, this->get_visible_transfer(context, transfer_id));

  return TransferSummary::from_record(visible.transfer);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::vector<TransferSummary> TransferManager::get_all_transfers(const RequestContext& context)
{
  std::vector<TransferRecord> transfers = this->store_.get_all_transfers();
  std::vector<TransferSummary> result;

  if (context.is_admin()) {
    for (const TransferRecord& transfer : transfers) {
      result.emplace_back(TransferSummary::from_record(transfer));
    }
    return result;
  }

  std::set<std::string, std::less<>> owned_volume_ids;
  for (const VolumeRecord& volume : this->store_.get_volumes_by_project(context.project_id())) {
    owned_volume_ids.emplace(volume.id);
  }

  for (const TransferRecord& transfer : transfers) {
    if (owned_volume_ids.count(transfer.volume_id) != 0) {
      result.emplace_back(TransferSummary::from_record(transfer));
    }
  }

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<TransferAcceptResult> TransferManager::accept_transfer(const RequestContext& context,
                                                                std::string_view transfer_id,
                                                                std::string_view auth_key)
{
  // Access to accept is granted by the (id, auth_key) pair; there is no ownership check.
  //
  StatusOr<TransferRecord> transfer = this->store_.get_transfer(transfer_id);
  if (!transfer.ok()) {
    VOLTX_LOG_REJECTED() << "[" << context.request_id() << "] Transfer not found;"
                         << BATT_INSPECT(transfer_id);
    return make_status(StatusCode::kTransferNotFound);
  }

  if (!auth_key_matches(*transfer, auth_key)) {
    this->metrics_.invalid_auth_key_count.add(1);
    VOLTX_LOG_REJECTED() << "[" << context.request_id()
                         << "] Attempt to accept transfer with invalid auth key;"
                         << BATT_INSPECT(transfer_id);
    return make_status(StatusCode::kInvalidAuthKey);
  }

  StatusOr<Volume> volume = Volume::get_by_id(context.elevated(), this->store_, transfer->volume_id);
  if (!volume.ok()) {
    if (status_is(volume.status(), StatusCode::kVolumeNotFound)) {
      return make_status(StatusCode::kTransferNotFound);
    }
    return volume.status();
  }

  const VolumeRecord donor_volume = volume->record();

  this->notify(context, donor_volume, event_names::kTransferAcceptStart);

  if (donor_volume.status != VolumeStatus::kAwaitingTransfer) {
    this->metrics_.accept_abort_count.add(1);
    VOLTX_LOG_REJECTED() << "[" << context.request_id() << "] Transfer volume " << donor_volume.id
                         << " must be awaiting-transfer, not " << donor_volume.status;
    return make_status(StatusCode::kInvalidVolume);
  }

  // Quota moves with the volume: reserve for the recipient, then a negative reservation (release)
  // for the donor.
  //
  QuotaDeltas deltas = volume_quota_deltas(donor_volume.size);
  {
    BATT_ASSIGN_OK_RESULT(Optional<VolumeTypeRecord> volume_type, volume->volume_type());
    add_volume_type_opts(&deltas, volume_type);
  }

  StatusOr<Reservations> recipient_reservations = this->quota_.reserve(context.project_id(), deltas);
  if (!recipient_reservations.ok()) {
    this->metrics_.accept_abort_count.add(1);
    VOLTX_LOG_REJECTED() << "[" << context.request_id() << "] Recipient project "
                         << context.project_id() << " cannot take volume " << donor_volume.id
                         << BATT_INSPECT(deltas) << BATT_INSPECT(recipient_reservations.status());
    return recipient_reservations.status();
  }

  StatusOr<Reservations> donor_reservations =
      this->quota_.reserve(donor_volume.project_id, negated(deltas));
  if (!donor_reservations.ok()) {
    this->metrics_.accept_abort_count.add(1);
    VOLTX_LOG_ERROR() << "[" << context.request_id() << "] Failed to reserve quota release for "
                      << donor_volume.project_id << BATT_INSPECT(donor_reservations.status());
    this->rollback_all({&*recipient_reservations});
    return donor_reservations.status();
  }

  // Reassign the volume.  This also unlocks it.
  //
  StatusOr<bool> reassigned = this->store_.conditional_update(
      donor_volume.id, VolumeStatus::kAwaitingTransfer,
      VolumeUpdate{
          .status = VolumeStatus::kAvailable,
          .project_id = context.project_id(),
          .user_id = context.user_id(),
      });
  if (!reassigned.ok() || !*reassigned) {
    this->metrics_.accept_abort_count.add(1);
    this->rollback_all({&*recipient_reservations, &*donor_reservations});
    if (!reassigned.ok()) {
      return reassigned.status();
    }
    VOLTX_LOG_REJECTED() << "[" << context.request_id() << "] Volume " << donor_volume.id
                         << " changed status during accept_transfer";
    return make_status(StatusCode::kInvalidVolume);
  }

  Status destroyed = this->store_.destroy_transfer(transfer->id);
  if (!destroyed.ok()) {
    this->metrics_.accept_abort_count.add(1);

    // If the record vanished under us (a concurrent delete), the volume goes back to its original
    // owner as available; otherwise it is locked again for the still-live transfer.
    //
    const VolumeStatus revert_status = status_is(destroyed, StatusCode::kTransferNotFound)
                                           ? VolumeStatus::kAvailable
                                           : VolumeStatus::kAwaitingTransfer;

    VOLTX_LOG_ERROR() << "[" << context.request_id() << "] Failed to consume transfer; reverting"
                      << BATT_INSPECT(transfer_id) << BATT_INSPECT(destroyed)
                      << BATT_INSPECT(revert_status);

    VOLTX_WARN_IF_NOT_OK(this->store_
                             .conditional_update(donor_volume.id, VolumeStatus::kAvailable,
                                                 VolumeUpdate{
                                                     .status = revert_status,
                                                     .project_id = donor_volume.project_id,
                                                     .user_id = donor_volume.user_id,
                                                 })
                             .status());

    this->rollback_all({&*recipient_reservations, &*donor_reservations});
    return destroyed;
  }

  // The reassignment is durable; now make the quota move permanent.
  //
  {
    Status commit_status = this->quota_.commit(*recipient_reservations);
    if (!commit_status.ok()) {
      VOLTX_LOG_ERROR() << "[" << context.request_id()
                        << "] Failed to commit recipient quota; usage may be stale"
                        << BATT_INSPECT(*recipient_reservations) << BATT_INSPECT(commit_status);
    }
  }
  {
    Status commit_status = this->quota_.commit(*donor_reservations);
    if (!commit_status.ok()) {
      VOLTX_LOG_ERROR() << "[" << context.request_id()
                        << "] Failed to commit donor quota release; usage may be stale"
                        << BATT_INSPECT(*donor_reservations) << BATT_INSPECT(commit_status);
    }
  }

  VolumeRecord accepted_volume = donor_volume;
  accepted_volume.status = VolumeStatus::kAvailable;
  accepted_volume.project_id = context.project_id();
  accepted_volume.user_id = context.user_id();
  this->notify(context, accepted_volume, event_names::kTransferAcceptEnd);

  this->metrics_.accept_count.add(1);
  VOLTX_LOG_INFO() << "[" << context.request_id() << "] Volume " << donor_volume.id
                   << " transferred from project " << donor_volume.project_id << " to project "
                   << context.project_id();

  return TransferAcceptResult{
      .id = transfer->id,
      .display_name = transfer->display_name,
      .volume_id = transfer->volume_id,
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status TransferManager::delete_transfer(const RequestContext& context,
                                        std::string_view transfer_id)
{
  BATT_ASSIGN_OK_RESULT(VisibleTransfer visible, this->get_visible_transfer(context, transfer_id));

  this->notify(context, visible.volume, event_names::kTransferDeleteStart);

  BATT_REQUIRE_OK(this->store_.destroy_transfer(visible.transfer.id));

  StatusOr<bool> unlocked =
      this->store_.conditional_update(visible.volume.id, VolumeStatus::kAwaitingTransfer,
                                      VolumeUpdate{.status = VolumeStatus::kAvailable});
  if (!unlocked.ok()) {
    VOLTX_LOG_WARNING() << "[" << context.request_id() << "] Failed to unlock volume "
                        << visible.volume.id << BATT_INSPECT(unlocked.status());
  } else if (!*unlocked) {
    VOLTX_LOG_WARNING() << "[" << context.request_id() << "] Volume " << visible.volume.id
                        << " was no longer awaiting-transfer when its transfer was deleted;"
                        << " leaving its status unchanged";
  } else {
    visible.volume.status = VolumeStatus::kAvailable;
  }

  this->notify(context, visible.volume, event_names::kTransferDeleteEnd);

  this->metrics_.delete_count.add(1);
  VOLTX_VLOG(1) << "[" << context.request_id() << "] Deleted transfer " << visible.transfer;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
auto TransferManager::get_visible_transfer(const RequestContext& context,
                                           std::string_view transfer_id)
    -> StatusOr<VisibleTransfer>
{
  StatusOr<TransferRecord> transfer = this->store_.get_transfer(transfer_id);
  if (!transfer.ok()) {
    VOLTX_VLOG(1) << "[" << context.request_id() << "] Transfer not found;"
                  << BATT_INSPECT(transfer_id);
    return make_status(StatusCode::kTransferNotFound);
  }

  StatusOr<VolumeRecord> volume = this->store_.get_volume(transfer->volume_id);
  if (!volume.ok() || !context.can_see_project(volume->project_id)) {
    VOLTX_VLOG(1) << "[" << context.request_id() << "] Transfer not visible;"
                  << BATT_INSPECT(transfer_id) << BATT_INSPECT(context);
    return make_status(StatusCode::kTransferNotFound);
  }

  return VisibleTransfer{
      .transfer = std::move(*transfer),
      .volume = std::move(*volume),
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void TransferManager::notify(const RequestContext& context, const VolumeRecord& volume,
                             std::string_view event_name)
{
  this->notifier_.emit(context, VolumeUsagePayload::from_record(volume), event_name);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void TransferManager::rollback_all(std::initializer_list<const Reservations*> reservations)
{
  for (const Reservations* r : reservations) {
    BATT_CHECK_NOT_NULLPTR(r);
    VOLTX_WARN_IF_NOT_OK(this->quota_.rollback(*r));
  }
}

}  // namespace voltx
