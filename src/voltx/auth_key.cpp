//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/auth_key.hpp>
//

#include <voltx/logging.hpp>

#include <batteries/assert.hpp>

#include <openssl/rand.h>

#include <limits>
#include <utility>
#include <vector>

namespace voltx {

namespace {

// Returns a uniformly distributed integer in [0, bound); uses rejection sampling so that no value
// is favored when `bound` does not divide 2^32.
//
StatusOr<usize> random_index(usize bound)
{
  BATT_CHECK_GT(bound, 0u);

  const u64 range = u64{std::numeric_limits<u32>::max()} + 1;
  const u64 limit = range - (range % bound);

  for (;;) {
    u32 sample = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&sample), sizeof(sample)) != 1) {
      VOLTX_LOG_ERROR() << "RAND_bytes failed";
      return make_status(StatusCode::kRandomSourceFailed);
    }
    if (sample < limit) {
      return static_cast<usize>(sample % bound);
    }
  }
}

Status shuffle_in_place(std::string* s)
{
  for (usize i = s->size(); i > 1; --i) {
    BATT_ASSIGN_OK_RESULT(const usize j, random_index(i));
    std::swap((*s)[i - 1], (*s)[j]);
  }
  return OkStatus();
}

StatusOr<char> random_char_from(std::string_view symbols)
{
  BATT_ASSIGN_OK_RESULT(const usize i, random_index(symbols.size()));
  return symbols[i];
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> generate_password(PasswordLength length)
{
  if (length.value() == 0 || length.value() > kMaxPasswordLength) {
    VOLTX_LOG_ERROR() << "password length out of range;" << BATT_INSPECT(length.value())
                      << BATT_INSPECT(kMaxPasswordLength);
    return {batt::StatusCode::kInvalidArgument};
  }

  std::string password;
  password.reserve(length);

  // One character from each group first, so every class is represented.
  //
  for (std::string_view group : kPasswordSymbolGroups) {
    BATT_ASSIGN_OK_RESULT(char ch, random_char_from(group));
    password.push_back(ch);
  }
  BATT_REQUIRE_OK(shuffle_in_place(&password));

  if (password.size() > length) {
    password.resize(length);
  }

  std::string all_symbols;
  for (std::string_view group : kPasswordSymbolGroups) {
    all_symbols.append(group);
  }

  while (password.size() < length) {
    BATT_ASSIGN_OK_RESULT(char ch, random_char_from(all_symbols));
    password.push_back(ch);
  }
  BATT_REQUIRE_OK(shuffle_in_place(&password));

  return password;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Sha256 compute_transfer_crypt_hash(std::string_view salt, std::string_view auth_key)
{
  return compute_sha256(batt::as_seq(std::vector<batt::ConstBuffer>{
      batt::ConstBuffer{salt.data(), salt.size()},
      batt::ConstBuffer{auth_key.data(), auth_key.size()},
  }));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool auth_key_matches(const TransferRecord& transfer, std::string_view auth_key)
{
  return constant_time_equal(compute_transfer_crypt_hash(transfer.salt, auth_key),
                             transfer.crypt_hash);
}

}  // namespace voltx
