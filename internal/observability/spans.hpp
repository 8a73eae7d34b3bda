#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mirrorguard::runtime::config {
class RuntimeConfig;
}

namespace mirrorguard::observability {

// Installs an OTLP span exporter when observability.tracing_enabled is set.
bool InitializeTracing(const mirrorguard::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span around one engine operation (revert, rollback,
  synchronization). Compiles to nothing without ENABLE_OTEL.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const mirrorguard::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}
#endif

} // namespace mirrorguard::observability
