#pragma once

#include "service_context.hpp"
#include "vigil/agent/v1/admin_service.pb.h"

namespace vigil::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  vigil::agent::v1::StatsResponse
  Stats(const vigil::agent::v1::StatsRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace vigil::service
