//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/request_context.hpp>
//

#include <voltx/uuid.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
RequestContext::RequestContext(std::string_view user_id, std::string_view project_id,
                               bool is_admin)
    : user_id_{user_id}
    , project_id_{project_id}
    , is_admin_{is_admin}
    , request_id_{"req-" + random_id()}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
RequestContext RequestContext::elevated() const
{
  RequestContext copy = *this;
  copy.is_admin_ = true;
  return copy;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const RequestContext& t)
{
  return out << "RequestContext{.user_id=" << t.user_id() << ", .project_id=" << t.project_id()
             << ", .is_admin=" << t.is_admin() << ", .request_id=" << t.request_id() << ",}";
}

}  // namespace voltx
