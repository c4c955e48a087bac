#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>

#include "vigil/agent/v1/config_service.grpc.pb.h"
#include "internal/service/config_service.hpp"

namespace vigil::grpc {

// Metadata key naming the caller of SetConfig when the request leaves actor empty.
inline constexpr char kActorMetadataKey[] = "x-vigil-actor";

class ConfigServer final : public vigil::agent::v1::ConfigService::Service {
public:
  explicit ConfigServer(std::shared_ptr<vigil::service::ConfigService> svc);

  ::grpc::Status GetConfig(::grpc::ServerContext*,
                         const vigil::agent::v1::GetConfigRequest*,
                         vigil::agent::v1::GetConfigResponse*) override;

  ::grpc::Status SetConfig(::grpc::ServerContext*,
                         const vigil::agent::v1::SetConfigRequest*,
                         vigil::agent::v1::SetConfigResponse*) override;

  ::grpc::Status ListConfigAudit(::grpc::ServerContext*,
                               const vigil::agent::v1::ListConfigAuditRequest*,
                               vigil::agent::v1::ListConfigAuditResponse*) override;

private:
  std::shared_ptr<vigil::service::ConfigService> service_;
};

} // namespace vigil::grpc
