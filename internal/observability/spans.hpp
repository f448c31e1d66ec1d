#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace stowage::runtime::config {
class RuntimeConfig;
class ObservabilityConfig;
} // namespace stowage::runtime::config

namespace stowage::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

inline constexpr const char* kServiceName    = "stowage";
inline constexpr const char* kServiceVersion = "0.1.0";

#ifdef STOWAGE_ENABLE_OTEL
struct OtlpTarget {
  OtlpTransport transport = OtlpTransport::kGrpc;
  std::string   endpoint;
};

/*
  Exporter target for one signal ("traces" or "metrics"). The configured
  endpoint wins, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the collector's local default.
*/
OtlpTarget ResolveOtlpTarget(const stowage::runtime::config::ObservabilityConfig& observability, std::string_view signal);
#endif

bool InitializeTracing(const stowage::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const stowage::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. Ends the span on destruction; becomes the active span while alive.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordError(std::string_view description);

 private:
#ifdef STOWAGE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordPartUpload(bool success);
  void ObserveUploadDurationMs(std::string_view strategy, double duration_ms);
  void RecordCacheLookup(bool hit);
  void RecordLockTimeout();

 private:
  Metrics();
#ifdef STOWAGE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef STOWAGE_ENABLE_OTEL
inline bool InitializeTracing(const stowage::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const stowage::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordError(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPartUpload(bool) {
}

inline void Metrics::ObserveUploadDurationMs(std::string_view, double) {
}

inline void Metrics::RecordCacheLookup(bool) {
}

inline void Metrics::RecordLockTimeout() {
}
#endif

} // namespace stowage::observability
