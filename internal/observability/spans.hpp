#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace catalog::runtime::config {
class RuntimeConfig;
}

namespace catalog::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string               service_name{"catalog-registry"};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  std::chrono::milliseconds export_interval{1000};
};

OtlpConfig ToOtlpConfig(const catalog::runtime::config::RuntimeConfig& config);

// Both return false when the signal is disabled in config.
bool InitializeTracing(const catalog::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const catalog::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for the lifetime of the object.

  Without ENABLE_OTEL every member is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Registry instruments: request counts and latency per route, cache
  rebuild duration and integrity outcomes per backend.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveCacheBuildDurationMs(std::string_view backend, double duration_ms);
  void RecordCacheIntegrity(std::string_view backend, bool match);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const catalog::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const catalog::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveCacheBuildDurationMs(std::string_view, double) {
}

inline void Metrics::RecordCacheIntegrity(std::string_view, bool) {
}
#endif

} // namespace catalog::observability
