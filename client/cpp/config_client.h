#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/support/status.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "vigil/agent/v1.hpp"

namespace vigil::agent::client {

/*
  Synchronous client for the agent's control plane. Every call returns
  the gRPC status and fills the response only when it is OK.
*/
class ConfigClient {
 public:
  explicit ConfigClient(std::shared_ptr<grpc::Channel> channel, std::string actor = {});

  grpc::Status GetConfig(vigil::agent::v1::GetConfigResponse* response) const;

  // success=false with a message means the update was rejected and nothing
  // was stored; a non-OK status means the call itself failed.
  grpc::Status SetConfig(const vigil::agent::v1::ConfigUpdate& update, vigil::agent::v1::SetConfigResponse* response) const;

  grpc::Status ListConfigAudit(std::optional<vigil::agent::v1::SensorKind> kind, std::uint32_t limit,
                               vigil::agent::v1::ListConfigAuditResponse* response) const;

  grpc::Status Stats(vigil::agent::v1::StatsResponse* response) const;

 private:
  std::unique_ptr<vigil::agent::v1::ConfigService::Stub>     config_stub_;
  std::unique_ptr<vigil::agent::v1::AgentAdminService::Stub> admin_stub_;
  std::string                                                actor_;
};

} // namespace vigil::agent::client
