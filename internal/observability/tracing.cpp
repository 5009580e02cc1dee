#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace engram::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using engram::runtime::config::ObservabilityConfig;
using engram::runtime::config::OTLP_TRANSPORT_HTTP;

namespace {

constexpr const char* kInstrumentation = "engram.store";
constexpr const char* kVersion         = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

bool UsesHttp(const ObservabilityConfig& config) {
  return config.transport() == OTLP_TRANSPORT_HTTP;
}

// config first, then the standard OTEL_* variables, then the collector defaults
std::string Endpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }
  return UsesHttp(config) ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> Exporter(const ObservabilityConfig& config) {
  const auto endpoint = Endpoint(config);
  if (UsesHttp(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = endpoint.rfind("https://", 0) == 0;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  std::lock_guard lock(g_mutex);
  return g_tracer;
}

} // namespace

bool InitializeTracing(const engram::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) return false;

  const std::string service = observability.service_name().empty() ? "engram" : observability.service_name();
  auto              processor = sdktrace::BatchSpanProcessorFactory::Create(Exporter(observability), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(
      std::move(processor), resource::Resource::Create(resource::ResourceAttributes{{"service.name", service}}));

  std::lock_guard lock(g_mutex);
  g_provider = std::move(provider);
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kInstrumentation, kVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::lock_guard lock(g_mutex);
  if (!g_provider) return;

  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;
};

SpanScope::SpanScope(std::string_view operation, std::string_view branch) {
  auto tracer = Tracer();
  if (!tracer) return;

  impl_         = std::make_unique<Impl>();
  impl_->span   = tracer->StartSpan(std::string(operation));
  impl_->active = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
  if (!branch.empty()) impl_->span->SetAttribute("engram.branch", std::string(branch));
}

SpanScope::~SpanScope() {
  if (impl_) impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace engram::observability

#endif
