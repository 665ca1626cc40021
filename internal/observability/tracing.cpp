#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace threadnet::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName    = "threadnet-manager";
constexpr const char* kTracerVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string TraceEndpoint(const OtlpConfig& otlp) {
  if (!otlp.endpoint.empty()) {
    if (otlp.transport == OtlpTransport::kHttpProtobuf && otlp.endpoint.find("/v1/traces") == std::string::npos) {
      return otlp.endpoint + "/v1/traces";
    }
    return otlp.endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) {
    return endpoint;
  }
  return otlp.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& otlp) {
  if (otlp.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = TraceEndpoint(otlp);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = TraceEndpoint(otlp);
  options.use_ssl_credentials = !otlp.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_tracer;
}

} // namespace

OtlpConfig OtlpConfigFrom(const threadnet::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == threadnet::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                 : OtlpTransport::kGrpc;
  otlp.insecure  = otlp.endpoint.rfind("https://", 0) != 0;
  if (observability.has_trace_sample_ratio()) {
    otlp.trace_sample_ratio = observability.trace_sample_ratio();
  }
  return otlp;
}

bool InitializeTracing(const threadnet::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  const auto otlp = OtlpConfigFrom(config);

  // Spans started by a sampled caller stay sampled; roots use the ratio.
  auto sampler   = sdktrace::ParentBasedSamplerFactory::Create(sdktrace::TraceIdRatioBasedSamplerFactory::Create(otlp.trace_sample_ratio));
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp), sdktrace::BatchSpanProcessorOptions{});
  resource::ResourceAttributes attrs = {{"service.name", otlp.service_name}, {"service.version", std::string(kTracerVersion)}};
  auto provider = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs), std::move(sampler));

  std::lock_guard<std::mutex> lock(g_mutex);
  g_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kTracerName, kTracerVersion);

  THREADNET_LOG_INFO("tracing enabled", {StringField("endpoint", TraceEndpoint(otlp)), StringField("service", otlp.service_name),
                                         StringField("sample_ratio", std::to_string(otlp.trace_sample_ratio))});
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

// Without InitializeTracing spans are not recorded.
SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }

  const opentelemetry::nostd::string_view route(name.data(), name.size());

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kServer;
  impl_->span  = tracer->StartSpan(route, {{"rpc.system", "grpc"}, {"rpc.method", route}}, options);
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace threadnet::observability

#endif
