//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef VOLTX_LOGGING_NOTIFICATION_SINK_HPP
#define VOLTX_LOGGING_NOTIFICATION_SINK_HPP

#include <voltx/config.hpp>
//
#include <voltx/notification_sink.hpp>

#include <batteries/async/mutex.hpp>

#include <map>
#include <string>

namespace voltx {

/** \brief Writes one INFO log line per event and keeps a count of events by name.
 */
class LoggingNotificationSink : public NotificationSink
{
 public:
  LoggingNotificationSink() = default;

  void emit(const RequestContext& context, const VolumeUsagePayload& payload,
            std::string_view event_name) override;

  /** \brief The number of events named `event_name` emitted so far.
   */
  u64 count(std::string_view event_name);

  u64 total_count();

 private:
  batt::Mutex<std::map<std::string, u64, std::less<>>> counts_;
};

}  // namespace voltx

#endif  // VOLTX_LOGGING_NOTIFICATION_SINK_HPP
