#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef STOWAGE_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace stowage::observability {
namespace {

constexpr const char* kLoggerName     = "stowage";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Environment wins over the config file for every logging knob.
struct LogSettings {
  std::string level   = "info";
  std::string pattern = kDefaultPattern;
  bool        trace   = false;

  static LogSettings From(const stowage::runtime::config::RuntimeConfig& config) {
    LogSettings settings;
    if (!config.logging().level().empty()) settings.level = config.logging().level();
    if (!config.logging().pattern().empty()) settings.pattern = config.logging().pattern();
    settings.trace = config.observability().tracing_enabled();

    if (const char* level = std::getenv("STOWAGE_LOG_LEVEL")) settings.level = level;
    if (const char* pattern = std::getenv("STOWAGE_LOG_PATTERN")) settings.pattern = pattern;
    if (const char* trace = std::getenv("STOWAGE_LOG_INCLUDE_TRACE_CONTEXT")) {
      settings.trace = std::string(trace) == "1" || std::string(trace) == "true";
    }
    return settings;
  }
};

bool g_include_trace_context{false};

// Paths and error messages may contain spaces; quote those so key=value stays parseable.
void AppendField(std::string& out, const LogField& field) {
  out += ' ';
  out += field.key;
  out += '=';
  if (field.value.find_first_of(" \t\"") == std::string::npos) {
    out += field.value;
    return;
  }
  out += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

#ifdef STOWAGE_ENABLE_OTEL
template <std::size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (auto b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_id[16];
  uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  AppendField(out, {"trace_id", Hex(trace_id)});
  AppendField(out, {"span_id", Hex(span_id)});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const stowage::runtime::config::RuntimeConfig& config) {
  const auto settings = LogSettings::From(config);

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern);
  logger->set_level(spdlog::level::from_str(settings.level));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = settings.trace;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::default_logger_raw()->should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace stowage::observability
