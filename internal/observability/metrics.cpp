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

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define AEGIS_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define AEGIS_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "aegis/config/v1/config.pb.h"

namespace aegis::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char* kServiceName = "aegis-watch";

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

opentelemetry::nostd::string_view View(std::string_view value) {
  return {value.data(), value.size()};
}

std::string ResolveEndpoint(const std::string& configured, bool http) {
  if (!configured.empty()) {
    return configured;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }
  return http ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const aegis::config::v1::ObservabilityConfig& config) {
  const bool http     = config.transport() == "http";
  const auto endpoint = ResolveEndpoint(config.otlp_endpoint(), http);
  if (http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> admission_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> outcome_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      run_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scan_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scan_files;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> watch_overflow_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   in_flight_gauge;

  std::atomic<std::int64_t> queue_depth{0};
  std::atomic<std::int64_t> in_flight{0};
};

bool InitializeMetrics(const aegis::config::v1::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 1000);
#ifdef AEGIS_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(observability), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(observability), reader_options);
#endif

  auto res   = resource::Resource::Create(resource::ResourceAttributes{{"service.name", kServiceName}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
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
  impl_->meter  = provider->GetMeter(kServiceName, "0.1.0");

  impl_->admission_count      = impl_->meter->CreateUInt64Counter("aegis.admission.count", "Admission decisions by source and decision", "1");
  impl_->outcome_count        = impl_->meter->CreateUInt64Counter("aegis.task.outcome.count", "Terminal task outcomes", "1");
  impl_->run_duration_ms      = impl_->meter->CreateDoubleHistogram("aegis.task.duration_ms", "Orchestrator run duration", "ms");
  impl_->scan_count           = impl_->meter->CreateUInt64Counter("aegis.scan.count", "Completed or cancelled folder scans", "1");
  impl_->scan_files           = impl_->meter->CreateUInt64Counter("aegis.scan.files", "Directory entries visited and files admitted by scans", "1");
  impl_->watch_overflow_count = impl_->meter->CreateUInt64Counter("aegis.watch.overflow.count", "inotify queue overflows", "1");

  impl_->queue_depth_gauge = impl_->meter->CreateInt64ObservableGauge("aegis.queue.depth", "Tasks waiting for a worker", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl = static_cast<Impl*>(state);
        opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result)->Observe(
            impl->queue_depth.load());
      },
      impl_.get());

  impl_->in_flight_gauge = impl_->meter->CreateInt64ObservableGauge("aegis.queue.in_flight", "Fingerprints admitted and not yet released", "1");
  impl_->in_flight_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl = static_cast<Impl*>(state);
        opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result)->Observe(
            impl->in_flight.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAdmission(std::string_view source, std::string_view decision) {
  const std::initializer_list<AttributePair> attributes = {{"source", View(source)}, {"decision", View(decision)}};
  AddWithAttributes(impl_->admission_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordOutcome(std::string_view outcome, std::string_view reason_code) {
  const std::initializer_list<AttributePair> attributes = {{"outcome", View(outcome)}, {"reason", View(reason_code)}};
  AddWithAttributes(impl_->outcome_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRunDurationMs(std::string_view outcome, double duration_ms) {
  const std::initializer_list<AttributePair> attributes = {{"outcome", View(outcome)}};
  RecordWithAttributes(impl_->run_duration_ms, duration_ms, attributes);
}

void Metrics::RecordScan(std::string_view result, std::uint64_t visited, std::uint64_t admitted) {
  const std::initializer_list<AttributePair> scan = {{"result", View(result)}};
  AddWithAttributes(impl_->scan_count, static_cast<std::uint64_t>(1), scan);

  const std::initializer_list<AttributePair> visited_attr = {{"kind", "visited"}};
  AddWithAttributes(impl_->scan_files, visited, visited_attr);
  const std::initializer_list<AttributePair> admitted_attr = {{"kind", "admitted"}};
  AddWithAttributes(impl_->scan_files, admitted, admitted_attr);
}

void Metrics::RecordWatchOverflow() {
  impl_->watch_overflow_count->Add(1);
}

void Metrics::SetQueueDepth(std::uint64_t depth) {
  impl_->queue_depth.store(static_cast<std::int64_t>(depth));
}

void Metrics::SetInFlight(std::uint64_t in_flight) {
  impl_->in_flight.store(static_cast<std::int64_t>(in_flight));
}

} // namespace aegis::observability

#endif
