#pragma once

#include <string>
#include <string_view>

#include "service_context.hpp"
#include "vigil/agent/v1/config_service.pb.h"

namespace vigil::service {

inline constexpr std::size_t kDefaultAuditLimit = 100;
inline constexpr std::size_t kMaxAuditLimit     = 1000;

// Request field first, then the caller-supplied metadata, then the peer.
std::string ResolveActor(const vigil::agent::v1::SetConfigRequest& req, std::string_view metadata_actor, std::string_view peer);

class ConfigService {
public:
  explicit ConfigService(ServiceContext ctx);

  vigil::agent::v1::GetConfigResponse
  GetConfig(const vigil::agent::v1::GetConfigRequest& req);

  // Validation failures are reported in the response, not thrown.
  vigil::agent::v1::SetConfigResponse
  SetConfig(const vigil::agent::v1::SetConfigRequest& req, const std::string& actor);

  vigil::agent::v1::ListConfigAuditResponse
  ListConfigAudit(const vigil::agent::v1::ListConfigAuditRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace vigil::service
