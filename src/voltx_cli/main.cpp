//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -


//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// VOLTX Command-Line Interface.
//

#include <voltx_cli/simulate_command.hpp>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <voltx/config.hpp>
#include <voltx/status_code.hpp>

#include <batteries/assert.hpp>

#include <iostream>

int main(int argc, char** argv)
{
  BATT_CHECK(voltx::initialize_status_codes());

  CLI::App app{"Volume Transfer (VOLTX) Command Line Utility"};

  voltx_cli::add_simulate_command(&app);

  app.require_subcommand();

  CLI11_PARSE(app, argc, argv);

  return 0;
}
