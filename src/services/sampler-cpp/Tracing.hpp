#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if PERFBRIDGE_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct SpanHandle {
    bool valid = false;
#if PERFBRIDGE_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// Process-wide span source. Every call is a no-op unless the binary was built
// with OpenTelemetry and Configure() enabled it.
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if PERFBRIDGE_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Ends its span on scope exit; failed unless MarkSuccess() was called.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    void SetAttribute(const std::string& key, const std::string& value);
    void SetAttribute(const std::string& key, int64_t value);
    void MarkSuccess();

private:
    SpanHandle handle_;
    bool success_ = false;
};
