#include "Tracing.hpp"

#if PERFBRIDGE_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
constexpr const char* kDefaultServiceName = "perfbridge-sampler";
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if PERFBRIDGE_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    const std::string serviceName = config.serviceName.empty() ? kDefaultServiceName : config.serviceName;
    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", serviceName}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(
        std::move(processor),
        resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(kDefaultServiceName);
    enabled_ = true;
#else
    (void)kDefaultServiceName;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
#if PERFBRIDGE_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        handle.valid = true;
    }
#else
    (void)name;
#endif
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if PERFBRIDGE_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if PERFBRIDGE_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
#if PERFBRIDGE_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
    handle.valid = false;
}

void Tracer::Shutdown() {
#if PERFBRIDGE_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
}

ScopedSpan::ScopedSpan(const std::string& name)
    : handle_(Tracer::Instance().StartSpan(name)) {}

ScopedSpan::~ScopedSpan() {
    if (handle_.valid) {
        Tracer::Instance().EndSpan(handle_, success_);
    }
}

void ScopedSpan::SetAttribute(const std::string& key, const std::string& value) {
    if (handle_.valid) {
        Tracer::Instance().SetAttribute(handle_, key, value);
    }
}

void ScopedSpan::SetAttribute(const std::string& key, int64_t value) {
    if (handle_.valid) {
        Tracer::Instance().SetAttribute(handle_, key, value);
    }
}

void ScopedSpan::MarkSuccess() {
    success_ = true;
}
