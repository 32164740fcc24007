//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/transfer_manager_options.hpp>
//

#include <voltx/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/env.hpp>
#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ TransferManagerOptions TransferManagerOptions::with_default_values()
{
  TransferManagerOptions options;

  options  //
      .set_auth_key_length(batt::getenv_as<usize>("VOLTX_TRANSFER_KEY_LENGTH")  //
                               .value_or(kDefaultTransferAuthKeyLength))
      .set_salt_length(batt::getenv_as<usize>("VOLTX_TRANSFER_SALT_LENGTH")  //
                           .value_or(kDefaultTransferSaltLength));

  return options;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TransferManagerOptions& TransferManagerOptions::set_name(const std::string& value)
{
  this->name_ = value;
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TransferManagerOptions& TransferManagerOptions::set_auth_key_length(usize value)
{
  if (value < kMinTransferAuthKeyLength || value > kMaxPasswordLength) {
    VOLTX_LOG_WARNING() << "auth key length out of range; using the default"
                        << BATT_INSPECT(value) << BATT_INSPECT(kMinTransferAuthKeyLength)
                        << BATT_INSPECT(kMaxPasswordLength);
    value = kDefaultTransferAuthKeyLength;
  }
  this->auth_key_length_ = value;
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TransferManagerOptions& TransferManagerOptions::set_salt_length(usize value)
{
  if (value == 0 || value > kMaxPasswordLength) {
    VOLTX_LOG_WARNING() << "salt length out of range; using the default" << BATT_INSPECT(value)
                        << BATT_INSPECT(kMaxPasswordLength);
    value = kDefaultTransferSaltLength;
  }
  this->salt_length_ = value;
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const TransferManagerOptions& t)
{
  return out << "TransferManagerOptions{.name=" << batt::c_str_literal(t.name())
             << ", .auth_key_length=" << t.auth_key_length().value()
             << ", .salt_length=" << t.salt_length().value() << ",}";
}

}  // namespace voltx
