#include "internal/observability/otel_resource.hpp"

#ifdef ENABLE_OTEL

#include <unistd.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>

namespace vigil::observability {

namespace resource = opentelemetry::sdk::resource;

std::string ResolveOtlpEndpoint(const OtlpConfig& config, const char* signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string specific = "OTEL_EXPORTER_OTLP_";
  for (const char* c = signal; *c; ++c) {
    specific += static_cast<char>(std::toupper(static_cast<unsigned char>(*c)));
  }
  specific += "_ENDPOINT";
  if (const char* endpoint = std::getenv(specific.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return std::string("http://localhost:4318/v1/") + signal;
  }
  return "localhost:4317";
}

resource::Resource BuildAgentResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.namespace", "vigil"},
      {"service.version", kAgentVersion},
  };
  if (!config.instance_id.empty()) {
    attrs.SetAttribute("service.instance.id", config.instance_id);
  }

  char host[256] = {};
  if (::gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    attrs.SetAttribute("host.name", std::string(host));
  }
  attrs.SetAttribute("process.pid", static_cast<std::int64_t>(::getpid()));
  return resource::Resource::Create(attrs);
}

} // namespace vigil::observability

#endif
