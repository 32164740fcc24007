//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_STATUS_HPP
#define VOLTX_STATUS_HPP

#include <voltx/logging.hpp>
#include <voltx/status_code.hpp>

#include <batteries/optional.hpp>
#include <batteries/status.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

namespace voltx {

using batt::OkStatus;
using batt::Status;
using batt::StatusOr;

/** \brief Returns true iff `status` carries the given project status code.
 */
inline bool status_is(const Status& status, StatusCode code)
{
  return status == make_status(code);
}

#define VOLTX_WARN_IF_NOT_OK(expr)                                                                 \
  for (auto BOOST_PP_CAT(voltx_TmpStatusResult, __LINE__) = ::batt::make_optional((expr));         \
       BATT_HINT_FALSE(BOOST_PP_CAT(voltx_TmpStatusResult, __LINE__) &&                            \
                       !BOOST_PP_CAT(voltx_TmpStatusResult, __LINE__)->ok());                      \
       BOOST_PP_CAT(voltx_TmpStatusResult, __LINE__) = ::batt::None)                               \
  VOLTX_LOG_WARNING() << "Expected OK result, but got: \n\n"                                       \
                      << BOOST_PP_STRINGIZE((expr)) << " == "                                      \
                      << BOOST_PP_CAT(voltx_TmpStatusResult, __LINE__) << "\n\n"

}  // namespace voltx

#endif  // VOLTX_STATUS_HPP
