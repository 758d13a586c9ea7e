#include "Tracing.hpp"

#include <cstdio>
#include <iostream>
#include <random>
#include <utility>

#if CMT_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
// Lower-case hex of `bytes` random bytes.
std::string RandomId(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::string id;
    id.reserve(bytes * 2);
    char pair[3];
    for (size_t i = 0; i < bytes; ++i) {
        std::snprintf(pair, sizeof(pair), "%02x", static_cast<unsigned>(rng() & 0xff));
        id += pair;
    }
    return id;
}

std::string TraceParent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + (sampled ? "-01" : "-00");
}

#if CMT_ENABLE_OTEL
template <typename Value>
void SetSpanAttribute(SpanHandle& handle, const std::string& key, const Value& value) {
    if (handle.open && handle.span) {
        handle.span->SetAttribute(key, value);
    }
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    exporting_ = false;
#if CMT_ENABLE_OTEL
    if (!config.enabled) {
        return;
    }

    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
        std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options));
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(
        std::move(processor),
        opentelemetry::sdk::resource::Resource::Create({{"service.name", config.serviceName}}));

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = provider_->GetTracer(config.serviceName);
    exporting_ = true;
#else
    if (config.enabled) {
        std::cerr << "[Tracing] Built without CMT_ENABLE_OTEL; spans are not exported" << std::endl;
    }
#endif
}

bool Tracer::Enabled() const {
    return exporting_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
    handle.open = true;
#if CMT_ENABLE_OTEL
    if (exporting_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
        const auto context = handle.span->GetContext();
        if (context.IsValid()) {
            handle.traceparent = TraceParent(
                context.trace_id().ToLowerBase16(),
                context.span_id().ToLowerBase16(),
                context.trace_flags().IsSampled());
            return handle;
        }
    }
#else
    (void)name;
#endif

    handle.traceparent = TraceParent(RandomId(16), RandomId(8), true);
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if CMT_ENABLE_OTEL
    SetSpanAttribute(handle, key, value);
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if CMT_ENABLE_OTEL
    SetSpanAttribute(handle, key, value);
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::AddEvent(SpanHandle& handle, const std::string& name) {
#if CMT_ENABLE_OTEL
    if (handle.open && handle.span) {
        handle.span->AddEvent(name);
    }
#else
    (void)handle;
    (void)name;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
    if (!handle.open) {
        return;
    }
    handle.open = false;
#if CMT_ENABLE_OTEL
    if (handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)success;
#endif
}

void Tracer::Shutdown() {
#if CMT_ENABLE_OTEL
    if (provider_) {
        provider_->ForceFlush();
        provider_->Shutdown();
    }
#endif
    exporting_ = false;
}
