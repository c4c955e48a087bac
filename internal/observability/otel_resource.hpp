#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "internal/observability/spans.hpp"

namespace vigil::observability {

// signal is "traces" or "metrics"; picks the signal specific OTEL_* variable
// before the generic one.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal);

// service.* attributes plus host and process identity of this agent.
opentelemetry::sdk::resource::Resource BuildAgentResource(const OtlpConfig& config);

} // namespace vigil::observability

#endif
