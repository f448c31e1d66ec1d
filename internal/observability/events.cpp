#include "internal/observability/events.hpp"

#include <algorithm>
#include <sstream>

#include "internal/observability/logging.hpp"

namespace stowage::observability {

std::string_view EventName(EventKind kind) {
  switch (kind) {
    case EventKind::kPartFailed:
      return "part_failed";
    case EventKind::kPartRetried:
      return "part_retried";
    case EventKind::kUploadCompleted:
      return "upload_completed";
    case EventKind::kUploadAborted:
      return "upload_aborted";
    case EventKind::kCacheHit:
      return "cache_hit";
    case EventKind::kCacheMiss:
      return "cache_miss";
    case EventKind::kLockTimeout:
      return "lock_timeout";
    case EventKind::kVersionConflict:
      return "version_conflict";
  }
  return "unknown";
}

void LoggingEventSink::Emit(const Event& event) {
  std::ostringstream message;
  message << EventName(event.kind) << " subject=" << event.subject;
  for (const auto& [key, value] : event.attributes) {
    message << ' ' << key << '=' << value;
  }

  const auto level = (event.kind == EventKind::kPartFailed || event.kind == EventKind::kLockTimeout) ? spdlog::level::warn
                     : (event.kind == EventKind::kCacheHit || event.kind == EventKind::kCacheMiss)   ? spdlog::level::debug
                                                                                                     : spdlog::level::info;

  Log(level, message.str());
}

void RecordingEventSink::Emit(const Event& event) {
  std::lock_guard lock(mutex_);
  events_.push_back(event);
}

std::vector<Event> RecordingEventSink::Events() const {
  std::lock_guard lock(mutex_);
  return events_;
}

std::size_t RecordingEventSink::Count(EventKind kind) const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(), [kind](const Event& e) { return e.kind == kind; }));
}

void RecordingEventSink::Clear() {
  std::lock_guard lock(mutex_);
  events_.clear();
}

EventSinkPtr OrNullSink(EventSinkPtr sink) {
  if (sink) {
    return sink;
  }
  return std::make_shared<NullEventSink>();
}

} // namespace stowage::observability
