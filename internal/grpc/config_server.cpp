#include "config_server.hpp"

#include "grpc_error.hpp"

namespace vigil::grpc {

namespace {

std::string MetadataActor(const ::grpc::ServerContext& context) {
  const auto& metadata = context.client_metadata();
  const auto  it       = metadata.find(kActorMetadataKey);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

} // namespace

ConfigServer::ConfigServer(std::shared_ptr<vigil::service::ConfigService> svc) : service_(std::move(svc)) {
}

::grpc::Status ConfigServer::GetConfig(::grpc::ServerContext*, const vigil::agent::v1::GetConfigRequest* req, vigil::agent::v1::GetConfigResponse* resp) {
  try {
    *resp = service_->GetConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConfigServer::SetConfig(::grpc::ServerContext* context, const vigil::agent::v1::SetConfigRequest* req, vigil::agent::v1::SetConfigResponse* resp) {
  try {
    const auto metadata_actor = MetadataActor(*context);
    // peer() needs a live call; only ask when nothing else names the caller
    const auto peer  = req->actor().empty() && metadata_actor.empty() ? context->peer() : std::string();
    const auto actor = vigil::service::ResolveActor(*req, metadata_actor, peer);
    *resp            = service_->SetConfig(*req, actor);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ConfigServer::ListConfigAudit(::grpc::ServerContext*, const vigil::agent::v1::ListConfigAuditRequest* req,
                                             vigil::agent::v1::ListConfigAuditResponse* resp) {
  try {
    *resp = service_->ListConfigAudit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vigil::grpc
