#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace ure::runtime::config {
class RuntimeConfig;
}

namespace ure::observability {

/*
  OTLP export is configured from the observability section; the endpoint
  falls back to OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT. Without URE_ENABLE_OTEL everything below is
  a no-op.
*/
bool InitializeTracing(const ure::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const ure::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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
  void RecordException(std::string_view description);

 private:
#ifdef URE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: "new", "duplicate", "rejected" or "errored".
  void RecordAdmission(std::string_view outcome);
  void ObserveExecDurationMs(std::string_view exec_nature, double duration_ms, bool success);

 private:
  Metrics();
#ifdef URE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef URE_ENABLE_OTEL
inline bool InitializeTracing(const ure::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const ure::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordAdmission(std::string_view) {
}

inline void Metrics::ObserveExecDurationMs(std::string_view, double, bool) {
}
#endif

} // namespace ure::observability
