#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace vigil::grpc {

AdminServer::AdminServer(std::shared_ptr<vigil::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const vigil::agent::v1::StatsRequest* req, vigil::agent::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vigil::grpc
