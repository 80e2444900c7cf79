#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace vigil::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> capture_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      spool_write_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   spool_bytes_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upload_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> dispatch_outcomes;

  std::mutex                                    spool_bytes_mutex;
  std::unordered_map<std::string, std::int64_t> spool_bytes;
};

bool InitializeMetrics(const vigil::runtime::config::ObservabilityConfig& config) {
  if (!config.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = config.otlp_endpoint();
  otlp_config.transport =
      config.transport() == vigil::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!config.service_name().empty()) {
    otlp_config.service_name = config.service_name();
  }

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(config.metrics_interval_ms() > 0 ? config.metrics_interval_ms() : 1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("vigil", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("vigil.request.count", "1", "Total number of RPCs served");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("vigil.request.latency_ms", "ms", "RPC latency in milliseconds");
  impl_->capture_outcomes   = impl_->meter->CreateUInt64Counter("vigil.capture.events", "1", "Captured events by outcome");
  impl_->spool_write_ms     = impl_->meter->CreateDoubleHistogram("vigil.spool.write_ms", "ms", "Spool batch write duration");
  impl_->upload_outcomes    = impl_->meter->CreateUInt64Counter("vigil.upload.batches", "1", "Spool uploads by outcome");
  impl_->dispatch_outcomes  = impl_->meter->CreateUInt64Counter("vigil.dispatch.calls", "1", "Module dispatch calls by outcome");
  impl_->spool_bytes_gauge  = impl_->meter->CreateInt64ObservableGauge("vigil.spool.bytes", "Bytes held in the spool directory", "By");
  impl_->spool_bytes_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->spool_bytes_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [dir, bytes] : impl->spool_bytes) {
          const std::initializer_list<AttributePair> attributes = {{"spool_dir", dir}};
          int_result->Observe(bytes, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordCaptureOutcome(std::string_view outcome) {
  if (!impl_ || !impl_->capture_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->capture_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveSpoolWriteMs(double duration_ms) {
  if (!impl_ || !impl_->spool_write_ms) {
    return;
  }
  RecordWithAttributes(impl_->spool_write_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetSpoolBytes(std::string_view spool_dir, std::uint64_t bytes) {
  if (!impl_ || !impl_->spool_bytes_gauge) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->spool_bytes_mutex);
  impl_->spool_bytes[std::string(spool_dir)] = static_cast<std::int64_t>(bytes);
}

void Metrics::RecordUpload(std::string_view outcome) {
  if (!impl_ || !impl_->upload_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->upload_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDispatch(std::string_view module, std::string_view outcome) {
  if (!impl_ || !impl_->dispatch_outcomes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"module", std::string(module)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->dispatch_outcomes, static_cast<std::uint64_t>(1), attributes);
}

} // namespace vigil::observability

#endif
