//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the VOLTX Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <voltx/logging_notification_sink.hpp>
//

#include <voltx/logging.hpp>

#include <batteries/stream_util.hpp>

namespace voltx {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LoggingNotificationSink::emit(const RequestContext& context,
                                   const VolumeUsagePayload& payload, std::string_view event_name)
{
  VOLTX_LOG_INFO() << "[" << context.request_id() << "] " << event_name << " " << payload;

  auto locked = this->counts_.lock();
  locked->operator[](std::string{event_name}) += 1;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u64 LoggingNotificationSink::count(std::string_view event_name)
{
  auto locked = this->counts_.lock();

  auto iter = locked->find(event_name);
  if (iter == locked->end()) {
    return 0;
  }
  return iter->second;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u64 LoggingNotificationSink::total_count()
{
  u64 total = 0;

  auto locked = this->counts_.lock();
  for (const auto& [name, n] : *locked) {
    total += n;
  }

  return total;
}

}  // namespace voltx
