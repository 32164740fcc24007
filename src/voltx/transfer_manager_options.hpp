//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_TRANSFER_MANAGER_OPTIONS_HPP
#define VOLTX_TRANSFER_MANAGER_OPTIONS_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>

#include <ostream>
#include <string>

namespace voltx {

class TransferManagerOptions
{
 public:
  static constexpr const char* kDefaultName = "default";

  using Self = TransferManagerOptions;

  /** \brief Returns the built-in defaults, with the auth key and salt lengths overridden by
   * VOLTX_TRANSFER_KEY_LENGTH and VOLTX_TRANSFER_SALT_LENGTH if set.
   */
  static TransferManagerOptions with_default_values();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  //----- --- -- -  -  -   -
  // (setters - begin)

  Self& set_name(const std::string& value);

  /** \brief Values outside [kMinTransferAuthKeyLength, kMaxPasswordLength] are replaced by
   * kDefaultTransferAuthKeyLength (with a warning).
   */
  Self& set_auth_key_length(usize value);

  /** \brief Values outside [1, kMaxPasswordLength] are replaced by kDefaultTransferSaltLength
   * (with a warning).
   */
  Self& set_salt_length(usize value);

  // (setters - end)
  //----- --- -- -  -  -   -

  const std::string& name() const noexcept
  {
    return this->name_;
  }

  PasswordLength auth_key_length() const noexcept
  {
    return PasswordLength{this->auth_key_length_};
  }

  PasswordLength salt_length() const noexcept
  {
    return PasswordLength{this->salt_length_};
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

 private:
  // Used to build metric names; must be unique among live TransferManager instances.
  //
  std::string name_ = kDefaultName;

  // Length of the one-time secret handed to the creator of a transfer.
  //
  usize auth_key_length_ = kDefaultTransferAuthKeyLength;

  usize salt_length_ = kDefaultTransferSaltLength;
};

std::ostream& operator<<(std::ostream& out, const TransferManagerOptions& t);

}  // namespace voltx

#endif  // VOLTX_TRANSFER_MANAGER_OPTIONS_HPP
