#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace engram::runtime::config {
class RuntimeConfig;
}

namespace engram::observability {

// Installs an OTLP trace pipeline when config.observability.tracing_enabled
// is set. Returns whether spans are exported.
bool InitializeTracing(const engram::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span around one store operation, tagged with the branch it touches.

  Compiles to nothing unless the build enables OpenTelemetry.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view operation, std::string_view branch = {});
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Marks the span failed; the operation may still retry.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const engram::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace engram::observability
