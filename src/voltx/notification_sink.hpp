//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_NOTIFICATION_SINK_HPP
#define VOLTX_NOTIFICATION_SINK_HPP

#include <voltx/config.hpp>
//
#include <voltx/api_types.hpp>
#include <voltx/request_context.hpp>
#include <voltx/volume_record.hpp>
#include <voltx/volume_status.hpp>

#include <ostream>
#include <string>
#include <string_view>

namespace voltx {

namespace event_names {

constexpr std::string_view kTransferCreateStart = "transfer.create.start";
constexpr std::string_view kTransferCreateEnd = "transfer.create.end";
constexpr std::string_view kTransferAcceptStart = "transfer.accept.start";
constexpr std::string_view kTransferAcceptEnd = "transfer.accept.end";
constexpr std::string_view kTransferDeleteStart = "transfer.delete.start";
constexpr std::string_view kTransferDeleteEnd = "transfer.delete.end";

}  // namespace event_names

/** \brief The volume usage snapshot carried by every transfer lifecycle event.
 */
struct VolumeUsagePayload {
  std::string volume_id;
  std::string project_id;
  std::string user_id;
  std::string volume_type_id;
  std::string display_name;
  i64 size = 0;
  VolumeStatus status = VolumeStatus::kCreating;
  Timestamp created_at;

  static VolumeUsagePayload from_record(const VolumeRecord& volume);
};

std::ostream& operator<<(std::ostream& out, const VolumeUsagePayload& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
/** \brief Receiver of transfer lifecycle events.  Delivery is fire-and-forget: emit never fails
 * and the caller never waits on any downstream consumer.
 */
class NotificationSink
{
 public:
  NotificationSink(const NotificationSink&) = delete;
  NotificationSink& operator=(const NotificationSink&) = delete;

  virtual ~NotificationSink() = default;

  virtual void emit(const RequestContext& context, const VolumeUsagePayload& payload,
                    std::string_view event_name) = 0;

 protected:
  NotificationSink() = default;
};

}  // namespace voltx

#endif  // VOLTX_NOTIFICATION_SINK_HPP
