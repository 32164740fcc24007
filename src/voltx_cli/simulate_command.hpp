//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -


#pragma once
#ifndef VOLTX_CLI_SIMULATE_COMMAND_HPP
#define VOLTX_CLI_SIMULATE_COMMAND_HPP

#include <CLI/App.hpp>

#include <voltx/config.hpp>
#include <voltx/int_types.hpp>

#include <string>

namespace voltx_cli {

using namespace voltx::int_types;

CLI::App* add_simulate_command(CLI::App* app);

struct SimulateCommandArgs {
  usize volume_count = 3;
  i64 volume_size = 10;
  std::string volume_type;
  i64 recipient_volume_limit = voltx::kUnlimitedQuota;
  bool wrong_key = false;
};

int run_simulate_command(SimulateCommandArgs& args);

}  // namespace voltx_cli

#endif  // VOLTX_CLI_SIMULATE_COMMAND_HPP
