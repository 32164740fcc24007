//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_REQUEST_CONTEXT_HPP
#define VOLTX_REQUEST_CONTEXT_HPP

#include <voltx/config.hpp>
//

#include <ostream>
#include <string>
#include <string_view>

namespace voltx {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief The authenticated identity on whose behalf a request runs: the tenant (project), the
 * user within it, and whether the caller has administrative rights.
 */
class RequestContext
{
 public:
  /** \brief Creates a non-admin context with a freshly generated request id.
   */
  explicit RequestContext(std::string_view user_id, std::string_view project_id,
                          bool is_admin = false);

  const std::string& user_id() const noexcept
  {
    return this->user_id_;
  }

  const std::string& project_id() const noexcept
  {
    return this->project_id_;
  }

  bool is_admin() const noexcept
  {
    return this->is_admin_;
  }

  /** \brief Unique id of this request ("req-<uuid>"); carried into log lines and notifications.
   */
  const std::string& request_id() const noexcept
  {
    return this->request_id_;
  }

  /** \brief Returns a copy of this context with admin rights; user, project and request id are
   * unchanged.
   */
  RequestContext elevated() const;

  /** \brief Returns true iff this context may see resources owned by `project_id`.
   */
  bool can_see_project(std::string_view project_id) const noexcept
  {
    return this->is_admin_ || this->project_id_ == project_id;
  }

 private:
  std::string user_id_;
  std::string project_id_;
  bool is_admin_;
  std::string request_id_;
};

std::ostream& operator<<(std::ostream& out, const RequestContext& t);

}  // namespace voltx

#endif  // VOLTX_REQUEST_CONTEXT_HPP
