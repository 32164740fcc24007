//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_TRANSFER_RECORD_HPP
#define VOLTX_TRANSFER_RECORD_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/sha256.hpp>

#include <ostream>
#include <string>

namespace voltx {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief A pending ownership transfer of one volume.
 *
 * The plaintext auth key is never stored; only `crypt_hash` = SHA-256(salt || auth_key).
 * Records are created once and consumed (deleted) once; they are never updated in place.
 */
struct TransferRecord {
  std::string id;
  std::string volume_id;
  std::string display_name;
  std::string salt;
  Sha256 crypt_hash;
  Timestamp created_at;
};

std::ostream& operator<<(std::ostream& out, const TransferRecord& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief The caller-visible fields of a transfer, returned by get/get_all.
 */
struct TransferSummary {
  std::string id;
  std::string volume_id;
  std::string display_name;
  Timestamp created_at;

  static TransferSummary from_record(const TransferRecord& record);
};

std::ostream& operator<<(std::ostream& out, const TransferSummary& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief Returned by create: the summary plus the plaintext auth key, which is not retrievable
 * again afterwards.
 */
struct TransferCreateResult : TransferSummary {
  std::string auth_key;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief Returned by a successful accept.
 */
struct TransferAcceptResult {
  std::string id;
  std::string display_name;
  std::string volume_id;
};

std::ostream& operator<<(std::ostream& out, const TransferAcceptResult& t);

}  // namespace voltx

#endif  // VOLTX_TRANSFER_RECORD_HPP
