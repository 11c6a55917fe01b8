#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tending::runtime::config {
class RuntimeConfig;
}

namespace tending::observability {

/*
  Tracing and metrics for the tending service.

  Built with ENABLE_OTEL this exports over OTLP (grpc or http/protobuf)
  according to the observability config section. Without it every call
  below is an inline no-op, so call sites never need their own #ifdef.

  Spans:    one per RPC, named after the route, tagged with tending.sync_id
  Metrics:  tending.request.count       {route, success}
            tending.request.latency_ms  {route}
            tending.instance.created
            tending.import.records      {collection}
*/

bool InitializeTracing(const tending::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const tending::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

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

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordInstanceCreated();
  void RecordImport(std::uint64_t tenders, std::uint64_t chores, std::uint64_t history_entries);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifdef ENABLE_OTEL

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"tending-manager"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
OtlpConfig ResolveOtlpConfig(const tending::runtime::config::RuntimeConfig& config, OtlpSignal signal);

#else

inline bool InitializeTracing(const tending::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const tending::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordInstanceCreated() {
}

inline void Metrics::RecordImport(std::uint64_t, std::uint64_t, std::uint64_t) {
}

#endif

} // namespace tending::observability
