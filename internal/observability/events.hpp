#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stowage::observability {

/*
  Structured events emitted by the core for an external sink to record.

  The core never formats or ships these itself; the default sink forwards
  them to the structured logger.
*/
enum class EventKind {
  kPartFailed,
  kPartRetried,
  kUploadCompleted,
  kUploadAborted,
  kCacheHit,
  kCacheMiss,
  kLockTimeout,
  kVersionConflict,
};

std::string_view EventName(EventKind kind);

struct Event {
  EventKind                                        kind;
  std::string                                      subject; // path, cache key, ...
  std::vector<std::pair<std::string, std::string>> attributes;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Emit(const Event& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

class LoggingEventSink final : public EventSink {
 public:
  void Emit(const Event& event) override;
};

class NullEventSink final : public EventSink {
 public:
  void Emit(const Event&) override {
  }
};

// Keeps events in memory; used by tests and diagnostics.
class RecordingEventSink final : public EventSink {
 public:
  void Emit(const Event& event) override;

  std::vector<Event> Events() const;
  std::size_t        Count(EventKind kind) const;
  void               Clear();

 private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

// Never returns null.
EventSinkPtr OrNullSink(EventSinkPtr sink);

} // namespace stowage::observability
