//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef VOLTX_LOGGING_HPP
#define VOLTX_LOGGING_HPP

#include <voltx/config.hpp>

#include <glog/logging.h>

namespace voltx {

#define VOLTX_LOG_ERROR() LOG(ERROR)
#define VOLTX_LOG_WARNING() LOG(WARNING)
#define VOLTX_LOG_INFO() LOG(INFO)
#define VOLTX_VLOG(verbosity) VLOG((verbosity))

//+++++++++++-+-+--+----- --- -- -  -  -   -

// Rejected client requests (wrong key, bad volume state, over quota) are logged at WARNING level
// unless a unit test has asked for expected errors to be kept quiet.
//
#define VOLTX_LOG_REJECTED()                                                                       \
  if (!::voltx::suppress_log_output_for_test())                                                    \
  VOLTX_LOG_WARNING()

}  // namespace voltx

#endif  // VOLTX_LOGGING_HPP
