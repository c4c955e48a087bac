#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define VIGIL_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define VIGIL_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otel_resource.hpp"

namespace vigil::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

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

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> decode_errors;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> batch_flushes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> flushed_events;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      store_write_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> queue_drops;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> checkpoints;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> retention_deleted;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   channel_dropped_gauge;

  std::mutex                                    channel_dropped_mutex;
  std::unordered_map<std::string, std::int64_t> channel_dropped_values;
};

bool InitializeMetrics(const OtlpConfig& config, std::uint32_t collection_interval_ms) {
  auto endpoint = ResolveOtlpEndpoint(config, "metrics");

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
  reader_options.export_interval_millis = std::chrono::milliseconds(collection_interval_ms > 0 ? collection_interval_ms : 1000);
#ifdef VIGIL_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildAgentResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const OtlpConfig& config) {
  return InitializeMetrics(config, 1000);
}

bool InitializeMetrics(const vigil::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  return InitializeMetrics(ToOtlpConfig(config), observability.collection_interval_ms());
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
  impl_->meter  = provider->GetMeter(kInstrumentationName, kAgentVersion);

  impl_->request_count      = impl_->meter->CreateUInt64Counter("vigil.request.count", "1", "Total number of control plane requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("vigil.request.latency_ms", "ms", "Control plane request latency in milliseconds");
  impl_->decode_errors      = impl_->meter->CreateUInt64Counter("vigil.ring.decode_errors", "1", "Frames rejected by the codec");
  impl_->batch_flushes      = impl_->meter->CreateUInt64Counter("vigil.batch.flushes", "1", "Batches handed to the store writer");
  impl_->flushed_events     = impl_->meter->CreateUInt64Counter("vigil.batch.events", "1", "Events handed to the store writer");
  impl_->store_write_ms     = impl_->meter->CreateDoubleHistogram("vigil.store.write_ms", "ms", "Batch commit duration in milliseconds");
  impl_->queue_drops        = impl_->meter->CreateUInt64Counter("vigil.store.queue_drops", "1", "Events dropped from the full writer queue");
  impl_->checkpoints        = impl_->meter->CreateUInt64Counter("vigil.store.checkpoints", "1", "WAL checkpoint attempts");
  impl_->retention_deleted  = impl_->meter->CreateUInt64Counter("vigil.store.retention_deleted", "1", "Rows deleted by the retention reaper");
  impl_->channel_dropped_gauge = impl_->meter->CreateInt64ObservableGauge("vigil.ring.dropped", "Events dropped by a ring channel", "1");
  impl_->channel_dropped_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->channel_dropped_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [channel, dropped] : impl->channel_dropped_values) {
          const std::initializer_list<AttributePair> attributes = {{"channel", channel}};
          int_result->Observe(dropped, attributes);
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

void Metrics::SetChannelDropped(std::string_view channel, std::uint64_t dropped) {
  if (!impl_ || !impl_->channel_dropped_gauge) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->channel_dropped_mutex);
  impl_->channel_dropped_values[std::string(channel)] = static_cast<std::int64_t>(dropped);
}

void Metrics::RecordDecodeError(std::string_view channel) {
  if (!impl_ || !impl_->decode_errors) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"channel", std::string(channel)}};
  AddWithAttributes(impl_->decode_errors, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordBatchFlush(std::string_view table, std::uint64_t events) {
  if (!impl_ || !impl_->batch_flushes) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"table", std::string(table)}};
  AddWithAttributes(impl_->batch_flushes, static_cast<std::uint64_t>(1), attributes);
  AddWithAttributes(impl_->flushed_events, events, attributes);
}

void Metrics::ObserveStoreWriteMs(std::string_view table, double duration_ms) {
  if (!impl_ || !impl_->store_write_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"table", std::string(table)}};
  RecordWithAttributes(impl_->store_write_ms, duration_ms, attributes);
}

void Metrics::RecordQueueDrops(std::uint64_t events) {
  if (!impl_ || !impl_->queue_drops) {
    return;
  }
  AddWithAttributes(impl_->queue_drops, events, std::initializer_list<AttributePair>{});
}

void Metrics::RecordCheckpoint(bool forced, bool success) {
  if (!impl_ || !impl_->checkpoints) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"forced", forced}, {"success", success}};
  AddWithAttributes(impl_->checkpoints, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRetentionDeleted(std::string_view table, std::uint64_t rows) {
  if (!impl_ || !impl_->retention_deleted) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"table", std::string(table)}};
  AddWithAttributes(impl_->retention_deleted, rows, attributes);
}

} // namespace vigil::observability

#endif
