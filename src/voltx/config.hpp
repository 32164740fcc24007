//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_CONFIG_HPP
#define VOLTX_CONFIG_HPP

#include <voltx/constants.hpp>
#include <voltx/int_types.hpp>

#include <atomic>

namespace voltx {

// The default length (in characters) of the authorization key handed out when a transfer is
// created.
//
constexpr usize kDefaultTransferAuthKeyLength = 16;

// The default length (in characters) of the per-transfer salt mixed into the stored key hash.
//
constexpr usize kDefaultTransferSaltLength = 8;

// Shortest auth key length TransferManagerOptions accepts; shorter settings fall back to the
// default.
//
constexpr usize kMinTransferAuthKeyLength = 8;

// Upper bound on any generated password (auth key or salt).
//
constexpr usize kMaxPasswordLength = 256;

// Default per-project quota limits; a negative limit means "unlimited".
//
constexpr i64 kDefaultQuotaVolumes = 10;
constexpr i64 kDefaultQuotaGigabytes = 1000;
constexpr i64 kUnlimitedQuota = -1;

// How long a quota reservation may stay outstanding before it is eligible for expiry.
//
constexpr i64 kDefaultReservationExpireSeconds = 86400;

// ** FOR TESTING ONLY **
//
// Suppress ERROR/WARNING level output for expected errors while running unit tests.
//
inline std::atomic<bool>& suppress_log_output_for_test()
{
  static std::atomic<bool> value_{false};
  return value_;
}

}  // namespace voltx

#endif  // VOLTX_CONFIG_HPP
