#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "vigil/agent/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace vigil::grpc {

class AdminServer final : public vigil::agent::v1::AgentAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<vigil::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                     const vigil::agent::v1::StatsRequest*,
                     vigil::agent::v1::StatsResponse*) override;

private:
  std::shared_ptr<vigil::service::AdminService> service_;
};

} // namespace vigil::grpc
