#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace purchase::runtime::config {
class RuntimeConfig;
}

namespace purchase::observability {

/*
  Tracing and metrics. Compiled against the OpenTelemetry SDK when
  ENABLE_OTEL is defined; otherwise every call below is an inline no-op.
*/

bool InitializeTracing(const purchase::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const purchase::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: synced, network, auth, validation, server, malformed, rejected, no_lines
  void RecordSyncOutcome(std::string_view outcome);
  // outcome: refreshed, skipped_fresh, failed_kept_stale
  void RecordCacheRefresh(std::string_view kind, std::string_view outcome);
  void ObserveRemoteLatencyMs(std::string_view route, double latency_ms);
  void SetPendingPurchases(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const purchase::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const purchase::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordSyncOutcome(std::string_view) {
}

inline void Metrics::RecordCacheRefresh(std::string_view, std::string_view) {
}

inline void Metrics::ObserveRemoteLatencyMs(std::string_view, double) {
}

inline void Metrics::SetPendingPurchases(std::int64_t) {
}
#endif

} // namespace purchase::observability
