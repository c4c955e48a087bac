#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

namespace vigil::observability {

OtlpConfig ToOtlpConfig(const vigil::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.instance_id = config.channels().name_prefix();
  otlp.endpoint    = observability.otlp_endpoint();
  otlp.transport =
      observability.transport() == vigil::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return otlp;
}

} // namespace vigil::observability
