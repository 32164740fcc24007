//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -


#include <voltx_cli/simulate_command.hpp>
//

#include <voltx/logging_notification_sink.hpp>
#include <voltx/memory_quota_ledger.hpp>
#include <voltx/memory_volume_store.hpp>
#include <voltx/quota_deltas.hpp>
#include <voltx/transfer_manager.hpp>
#include <voltx/uuid.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <CLI/Validators.hpp>

#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>

namespace voltx_cli {

using namespace voltx;

namespace {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void print_usage(QuotaLedger& ledger, const RequestContext& context,
                 const std::vector<std::string>& resources)
{
  for (const std::string& resource : resources) {
    const QuotaUsage usage = ledger.get_usage(context.project_id(), resource);
    std::cout << "  " << std::setw(12) << std::left << context.project_id() << std::setw(20)
              << resource << " in_use=" << usage.in_use << " reserved=" << usage.reserved
              << " limit=" << usage.limit << std::endl;
  }
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
CLI::App* add_simulate_command(CLI::App* cmd)
{
  CLI::App* simulate_cmd = cmd->add_subcommand(
      "simulate", "Transfer volumes between two projects using an in-memory store and ledger");

  auto args = std::make_shared<SimulateCommandArgs>();

  simulate_cmd->add_option("-n,--volumes", args->volume_count, "Number of volumes to transfer.")
      ->check(CLI::NonNegativeNumber);
  simulate_cmd->add_option("-s,--size", args->volume_size, "Size of each volume (GiB).")
      ->check(CLI::PositiveNumber);
  simulate_cmd->add_option("-t,--type", args->volume_type,
                           "Name of the volume type to create the volumes with.");
  simulate_cmd
      ->add_option("--recipient-volume-limit", args->recipient_volume_limit,
                   "Limit on the recipient project's `volumes` resource (-1 for unlimited).")
      ->check(CLI::Range(kUnlimitedQuota, std::numeric_limits<i64>::max()));
  simulate_cmd->add_flag("--wrong-key", args->wrong_key,
                         "Present a wrong auth key on the first accept attempt.");

  simulate_cmd->callback([args] {
    const int exit_code = run_simulate_command(*args);
    if (exit_code != 0) {
      throw CLI::RuntimeError{exit_code};
    }
  });

  return simulate_cmd;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
int run_simulate_command(SimulateCommandArgs& args)
{
  MemoryVolumeStore store;
  MemoryQuotaLedger ledger{QuotaLedgerOptions::with_default_values()};
  LoggingNotificationSink sink;
  TransferManager manager{TransferManagerOptions::with_default_values(), store, ledger, sink};

  const RequestContext donor{"donor-user", "donor-project"};
  const RequestContext recipient{"recipient-user", "recipient-project"};

  if (args.recipient_volume_limit != kUnlimitedQuota) {
    Status limit_set =
        ledger.set_limit(recipient.project_id(), "volumes", args.recipient_volume_limit);
    if (!limit_set.ok()) {
      std::cerr << "invalid limit: " << limit_set << std::endl;
      return 1;
    }
  }

  Optional<VolumeTypeRecord> volume_type;
  if (!args.volume_type.empty()) {
    volume_type = VolumeTypeRecord{
        .id = random_id(),
        .name = args.volume_type,
    };
    BATT_CHECK_OK(store.create_volume_type(*volume_type));
  }

  std::vector<std::string> resources = {"volumes", "gigabytes"};
  {
    QuotaDeltas type_deltas;
    add_volume_type_opts(&type_deltas, volume_type);
    for (const auto& [resource, delta] : type_deltas) {
      resources.emplace_back(resource);
    }
  }

  // Create the donor's volumes, charging their quota as volume creation would.
  //
  for (usize i = 0; i < args.volume_count; ++i) {
    VolumeRecord volume;
    volume.id = random_id();
    volume.status = VolumeStatus::kAvailable;
    volume.project_id = donor.project_id();
    volume.user_id = donor.user_id();
    volume.size = args.volume_size;
    volume.display_name = batt::to_string("volume-", i);
    if (volume_type) {
      volume.volume_type_id = volume_type->id;
    }

    QuotaDeltas deltas = volume_quota_deltas(volume.size);
    add_volume_type_opts(&deltas, volume_type);

    StatusOr<Reservations> reserved = ledger.reserve(donor.project_id(), deltas);
    if (!reserved.ok()) {
      std::cerr << "donor quota exhausted after " << i << " volumes: " << reserved.status()
                << std::endl;
      return 1;
    }
    BATT_CHECK_OK(ledger.commit(*reserved));
    BATT_CHECK_OK(store.create_volume(volume));
  }

  std::cout << std::endl << "before:" << std::endl;
  print_usage(ledger, donor, resources);
  print_usage(ledger, recipient, resources);
  std::cout << std::endl;

  usize accepted_count = 0;
  for (const VolumeRecord& volume : store.get_volumes_by_project(donor.project_id())) {
    StatusOr<TransferCreateResult> created =
        manager.create_transfer(donor, volume.id, volume.display_name);
    if (!created.ok()) {
      std::cout << volume.id << ": create failed: " << created.status() << std::endl;
      continue;
    }
    std::cout << volume.id << ": transfer " << created->id << " created" << std::endl;

    if (args.wrong_key && accepted_count == 0) {
      StatusOr<TransferAcceptResult> rejected =
          manager.accept_transfer(recipient, created->id, "not-" + created->auth_key);
      std::cout << volume.id << ": accept with wrong key: " << rejected.status() << std::endl;
    }

    StatusOr<TransferAcceptResult> accepted =
        manager.accept_transfer(recipient, created->id, created->auth_key);
    if (!accepted.ok()) {
      std::cout << volume.id << ": accept failed: " << accepted.status() << std::endl;

      Status deleted = manager.delete_transfer(donor, created->id);
      std::cout << volume.id << ": transfer deleted: " << deleted << std::endl;
      continue;
    }
    ++accepted_count;
    std::cout << volume.id << ": accepted by " << recipient.project_id() << std::endl;
  }

  std::cout << std::endl << "after (" << accepted_count << "/" << args.volume_count
            << " transferred):" << std::endl;
  print_usage(ledger, donor, resources);
  print_usage(ledger, recipient, resources);
  std::cout << std::endl;

  const TransferManager::Metrics& metrics = manager.metrics();
  std::cout << "metrics: create=" << metrics.create_count.load()
            << " accept=" << metrics.accept_count.load()
            << " delete=" << metrics.delete_count.load()
            << " invalid_auth_key=" << metrics.invalid_auth_key_count.load()
            << " accept_abort=" << metrics.accept_abort_count.load() << std::endl;

  return 0;
}

}  // namespace voltx_cli
