#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ACCESSRES_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ACCESSRES_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace accessres::observability {
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> decode_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> frame_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> transition_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> upgrade_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> fetch_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      fetch_latency_ms;
};

bool InitializeMetrics(const OtlpConfig& config) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(config.collection_interval_ms > 0 ? config.collection_interval_ms : 1000);
#ifdef ACCESSRES_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const accessres::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == accessres::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                    : OtlpTransport::kGrpc;
  otlp_config.collection_interval_ms = observability.collection_interval_ms();
  return InitializeMetrics(otlp_config);
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
  impl_->meter  = provider->GetMeter("access-resolver", "0.1.0");

  impl_->decode_count     = impl_->meter->CreateUInt64Counter("access.frame.decode.count", "Push lines decoded by encoding", "1");
  impl_->frame_count      = impl_->meter->CreateUInt64Counter("access.frame.count", "Access frames seen by outcome", "1");
  impl_->transition_count = impl_->meter->CreateUInt64Counter("access.readiness.transitions", "Readiness transitions", "1");
  impl_->upgrade_count    = impl_->meter->CreateUInt64Counter("access.upgrade.count", "Upgrades applied", "1");
  impl_->fetch_count      = impl_->meter->CreateUInt64Counter("access.fetch.count", "Resolution fetches", "1");
  impl_->fetch_latency_ms = impl_->meter->CreateDoubleHistogram("access.fetch.latency_ms", "Resolution fetch latency in milliseconds", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordDecode(std::string_view encoding, bool success) {
  if (!impl_ || !impl_->decode_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"encoding", std::string(encoding)}, {"success", success}};
  AddWithAttributes(impl_->decode_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordFrame(std::string_view outcome) {
  if (!impl_ || !impl_->frame_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->frame_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTransition(std::string_view from, std::string_view to) {
  if (!impl_ || !impl_->transition_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"from", std::string(from)}, {"to", std::string(to)}};
  AddWithAttributes(impl_->transition_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordUpgrade(bool automatic) {
  if (!impl_ || !impl_->upgrade_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"automatic", automatic}};
  AddWithAttributes(impl_->upgrade_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordFetch(std::string_view route, bool success) {
  if (!impl_ || !impl_->fetch_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->fetch_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveFetchLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->fetch_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->fetch_latency_ms, latency_ms, attributes);
}

} // namespace accessres::observability

#endif
