#include "internal/observability/spans.hpp"

#ifdef URE_ENABLE_OTEL

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
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define URE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define URE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace ure::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace cfg         = ure::runtime::config;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char* kServiceName    = "ure-engine";
constexpr const char* kServiceVersion = "0.1.0";
constexpr uint32_t    kDefaultIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
std::atomic<bool>                          g_admission_enabled{true};
std::atomic<bool>                          g_exec_enabled{true};

opentelemetry::nostd::string_view View(std::string_view text) {
  return opentelemetry::nostd::string_view(text.data(), text.size());
}

bool UsesHttp(const cfg::ObservabilityConfig& config) {
  return config.transport() == cfg::OTLP_TRANSPORT_HTTP;
}

std::string MetricEndpoint(const cfg::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* variable : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(variable)) {
      return endpoint;
    }
  }
  return UsesHttp(config) ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const cfg::ObservabilityConfig& config) {
  if (UsesHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = MetricEndpoint(config);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = MetricEndpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// The SDK moved AddMetricReader from shared_ptr to unique_ptr between releases.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
         const std::initializer_list<AttributePair>& attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value,
            const std::initializer_list<AttributePair>& attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> admission_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      exec_duration_ms;
};

bool InitializeMetrics(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& settings = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(
      settings.collection_interval_ms() > 0 ? settings.collection_interval_ms() : kDefaultIntervalMs);
  if (settings.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(settings.export_timeout_ms());
  }

#ifdef URE_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(observability), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(observability), reader_options);
#endif

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", kServiceName}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create(attributes));
  AttachReader(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_admission_enabled = settings.admission_metrics_enabled();
  g_exec_enabled      = settings.exec_metrics_enabled();
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
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, kServiceVersion);

  impl_->admission_count =
      impl_->meter->CreateUInt64Counter("ure.admission.count", "Resource admissions by outcome", "1");
  impl_->exec_duration_ms =
      impl_->meter->CreateDoubleHistogram("ure.exec.duration_ms", "Orchestration exec duration", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAdmission(std::string_view outcome) {
  if (!impl_->admission_count || !g_admission_enabled) {
    return;
  }
  Add(impl_->admission_count, static_cast<std::uint64_t>(1), {{"outcome", View(outcome)}});
}

void Metrics::ObserveExecDurationMs(std::string_view exec_nature, double duration_ms, bool success) {
  if (!impl_->exec_duration_ms || !g_exec_enabled) {
    return;
  }
  Record(impl_->exec_duration_ms, duration_ms, {{"nature", View(exec_nature)}, {"success", success}});
}

} // namespace ure::observability

#endif
