#include "client/cpp/config_client.h"

#include <grpcpp/client_context.h>

namespace vigil::agent::client {

namespace {

// Matches the key the agent reads when the request carries no actor.
constexpr char kActorMetadataKey[] = "x-vigil-actor";

} // namespace

ConfigClient::ConfigClient(std::shared_ptr<grpc::Channel> channel, std::string actor)
    : config_stub_(vigil::agent::v1::ConfigService::NewStub(channel)),
      admin_stub_(vigil::agent::v1::AgentAdminService::NewStub(channel)),
      actor_(std::move(actor)) {
}

grpc::Status ConfigClient::GetConfig(vigil::agent::v1::GetConfigResponse* response) const {
  grpc::ClientContext                context;
  vigil::agent::v1::GetConfigRequest request;
  return config_stub_->GetConfig(&context, request, response);
}

grpc::Status ConfigClient::SetConfig(const vigil::agent::v1::ConfigUpdate& update, vigil::agent::v1::SetConfigResponse* response) const {
  grpc::ClientContext context;
  if (!actor_.empty()) {
    context.AddMetadata(kActorMetadataKey, actor_);
  }

  vigil::agent::v1::SetConfigRequest request;
  *request.mutable_config() = update;
  return config_stub_->SetConfig(&context, request, response);
}

grpc::Status ConfigClient::ListConfigAudit(std::optional<vigil::agent::v1::SensorKind> kind, std::uint32_t limit,
                                           vigil::agent::v1::ListConfigAuditResponse* response) const {
  grpc::ClientContext                      context;
  vigil::agent::v1::ListConfigAuditRequest request;
  if (kind.has_value()) {
    request.set_kind(*kind);
  }
  request.set_limit(limit);
  return config_stub_->ListConfigAudit(&context, request, response);
}

grpc::Status ConfigClient::Stats(vigil::agent::v1::StatsResponse* response) const {
  grpc::ClientContext            context;
  vigil::agent::v1::StatsRequest request;
  return admin_stub_->Stats(&context, request, response);
}

} // namespace vigil::agent::client
