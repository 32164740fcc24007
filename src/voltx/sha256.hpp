//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_SHA256_HPP
#define VOLTX_SHA256_HPP

#include <voltx/config.hpp>
//
#include <voltx/int_types.hpp>

#include <batteries/buffer.hpp>
#include <batteries/operators.hpp>
#include <batteries/optional.hpp>
#include <batteries/seq.hpp>
#include <batteries/seq/decay.hpp>
#include <batteries/static_assert.hpp>
#include <batteries/suppress.hpp>

#include <openssl/crypto.h>
#include <openssl/sha.h>

#include <array>
#include <cstring>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace voltx {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief A SHA-256 (32-byte) hash; used to store transfer auth keys without keeping the
 * plaintext.
 */
struct Sha256 {
  /** \brief The bytes of the SHA hash.
   */
  std::array<u8, SHA256_DIGEST_LENGTH> bytes;

  /** \brief Default initializes a Sha256 object; this does NOT set the initial contents of
   * `this->bytes`!
   */
  Sha256() = default;
};

BATT_STATIC_ASSERT_EQ(sizeof(Sha256), 32);

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/** \brief Prints a Sha256 as a lowercase hex string.
 */
std::ostream& operator<<(std::ostream& out, const Sha256& t);

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
inline bool operator==(const Sha256& l, const Sha256& r)
{
  return !std::memcmp(l.bytes.data(), r.bytes.data(), l.bytes.size());
}

BATT_EQUALITY_COMPARABLE((inline), Sha256, Sha256)

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/** \brief Compares two hashes in time independent of where (or whether) they differ.  Use this
 * instead of operator== whenever one side is derived from caller-supplied secret material.
 */
inline bool constant_time_equal(const Sha256& l, const Sha256& r)
{
  return CRYPTO_memcmp(l.bytes.data(), r.bytes.data(), l.bytes.size()) == 0;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BATT_SUPPRESS_IF_GCC("-Wdeprecated-declarations")

/** \brief Computes and returns the SHA-256 hash of the data contained in the passed Seq of
 * ConstBuffer.
 */
template <typename ConstBufferSeq,
          typename = std::enable_if_t<!std::is_convertible_v<ConstBufferSeq&&, batt::ConstBuffer>>>
Sha256 compute_sha256(ConstBufferSeq&& buffers)
{
  Sha256 hash;
  SHA256_CTX ctx;

  SHA256_Init(&ctx);

  for (;;) {
    batt::Optional<batt::ConstBuffer> buffer = buffers.next();
    if (!buffer) {
      break;
    }
    SHA256_Update(&ctx, buffer->data(), buffer->size());
  }

  SHA256_Final(hash.bytes.data(), &ctx);
  return hash;
}

/** \brief Computes and returns the SHA-256 hash of the data contained in the passed buffer.
 */
inline Sha256 compute_sha256(const batt::ConstBuffer& single_buffer)
{
  return compute_sha256(batt::seq::single_item(single_buffer)  //
                        | batt::seq::decayed());
}

BATT_UNSUPPRESS_IF_GCC()

}  // namespace voltx

#endif  // VOLTX_SHA256_HPP
