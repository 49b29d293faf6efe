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
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "config/config.pb.h"

namespace fleetlink::observability {
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

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> inbound_messages;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> decode_failures;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconnect_attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> mission_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   vehicles_gauge;

  std::mutex                                    vehicles_mutex;
  std::unordered_map<std::string, std::int64_t> vehicles_by_state;
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
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const fleetlink::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == fleetlink::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
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
  impl_->meter  = provider->GetMeter("fleetlink", "0.1.0");

  impl_->inbound_messages   = impl_->meter->CreateUInt64Counter("fleetlink.inbound.messages", "1", "Decoded inbound VDA5050 messages");
  impl_->decode_failures    = impl_->meter->CreateUInt64Counter("fleetlink.inbound.decode_failures", "1", "Dropped inbound messages");
  impl_->reconnect_attempts = impl_->meter->CreateUInt64Counter("fleetlink.broker.reconnect_attempts", "1", "Broker reconnect attempts");
  impl_->mission_outcomes   = impl_->meter->CreateUInt64Counter("fleetlink.mission.outcomes", "1", "Mission acknowledgement outcomes");
  impl_->vehicles_gauge     = impl_->meter->CreateInt64ObservableGauge("fleetlink.vehicles", "Vehicles per link state", "1");
  impl_->vehicles_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->vehicles_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [link_state, count] : impl->vehicles_by_state) {
          const std::initializer_list<AttributePair> attributes = {{"link_state", link_state}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordInboundMessage(std::string_view kind) {
  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->inbound_messages, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordDecodeFailure(std::string_view reason) {
  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  AddWithAttributes(impl_->decode_failures, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordReconnectAttempt(bool success) {
  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->reconnect_attempts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordMissionOutcome(std::string_view ack_state) {
  const std::initializer_list<AttributePair> attributes = {{"ack_state", std::string(ack_state)}};
  AddWithAttributes(impl_->mission_outcomes, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetVehicleCount(std::string_view link_state, std::uint64_t count) {
  std::lock_guard<std::mutex> lock(impl_->vehicles_mutex);
  impl_->vehicles_by_state[std::string(link_state)] = static_cast<std::int64_t>(count);
}

} // namespace fleetlink::observability

#endif
