#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace threadnet::runtime::config {
class RuntimeConfig;
}

namespace threadnet::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"threadnet-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  // false for https:// endpoints
  bool   insecure{true};
  double trace_sample_ratio{1.0};
};

// Exporter settings shared by tracing and metrics, from the observability
// section of the runtime config.
OtlpConfig OtlpConfigFrom(const threadnet::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const threadnet::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const threadnet::runtime::config::RuntimeConfig& config);
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
  // Marks the span failed.
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
  void SetDatasetCount(std::uint64_t count);
  // kind is "discovered" or "removed"
  void RecordRouterEvent(std::string_view kind);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const threadnet::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const threadnet::runtime::config::RuntimeConfig&) {
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

inline void Metrics::SetDatasetCount(std::uint64_t) {
}

inline void Metrics::RecordRouterEvent(std::string_view) {
}
#endif

} // namespace threadnet::observability
