//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_QUOTA_DELTAS_HPP
#define VOLTX_QUOTA_DELTAS_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/volume_record.hpp>

#include <map>
#include <ostream>
#include <string>

namespace voltx {

/** \brief Signed per-resource amounts to reserve against a project, keyed by resource name
 * ("volumes", "gigabytes", "volumes_<type>", ...).
 */
using QuotaDeltas = std::map<std::string, i64>;

/** \brief The base deltas for taking ownership of one volume of `size` GiB.
 */
QuotaDeltas volume_quota_deltas(i64 size);

/** \brief For a typed volume, adds "<resource>_<type name>" entries mirroring each base resource
 * in `deltas`.  Does nothing if `volume_type` is None.
 */
void add_volume_type_opts(QuotaDeltas* deltas, const Optional<VolumeTypeRecord>& volume_type);

/** \brief Returns `deltas` with every amount sign-flipped.
 */
QuotaDeltas negated(const QuotaDeltas& deltas);

std::ostream& operator<<(std::ostream& out, const QuotaDeltas& t);

}  // namespace voltx

#endif  // VOLTX_QUOTA_DELTAS_HPP
