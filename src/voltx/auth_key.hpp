//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_AUTH_KEY_HPP
#define VOLTX_AUTH_KEY_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/sha256.hpp>
#include <voltx/status.hpp>
#include <voltx/transfer_record.hpp>

#include <array>
#include <string>
#include <string_view>

namespace voltx {

// Character groups used to build passwords.  Visually ambiguous characters (0/O, 1/l/I) are
// excluded so keys can be read aloud or copied by hand.
//
constexpr std::array<std::string_view, 3> kPasswordSymbolGroups = {
    "23456789",
    "ABCDEFGHJKLMNPQRSTUVWXYZ",
    "abcdefghijkmnopqrstuvwxyz",
};

/** \brief Generates a random password of the given length using the OpenSSL CSPRNG.
 *
 * When `length` is at least the number of symbol groups, the result contains at least one
 * character from each group.
 *
 * \return kInvalidArgument if `length` is 0 or greater than kMaxPasswordLength;
 * kRandomSourceFailed if the random source could not produce bytes.
 */
StatusOr<std::string> generate_password(PasswordLength length);

/** \brief Returns SHA-256(salt || auth_key), the value stored in TransferRecord::crypt_hash.
 */
Sha256 compute_transfer_crypt_hash(std::string_view salt, std::string_view auth_key);

/** \brief Returns true iff `auth_key` hashes (with the record's salt) to the record's stored
 * hash.  The comparison is constant-time.
 */
bool auth_key_matches(const TransferRecord& transfer, std::string_view auth_key);

}  // namespace voltx

#endif  // VOLTX_AUTH_KEY_HPP
