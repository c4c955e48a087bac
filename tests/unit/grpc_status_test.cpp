#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <unistd.h>

#include <grpcpp/grpcpp.h>

#include "internal/db/sqlite/schema.hpp"
#include "internal/grpc/config_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/sensors/sensor_config_store.hpp"
#include "internal/service/config_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "vigil/agent/v1.hpp"

namespace {

std::shared_ptr<vigil::service::ConfigService> BuildConfigService() {
  const auto dir = std::filesystem::temp_directory_path() / "vigil_grpc_status_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / ("config-" + std::to_string(::getpid()) + ".db")).string();
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }

  auto db = std::make_shared<vigil::db::sqlite::SqliteDB>(path);
  vigil::db::sqlite::BootstrapSchema(db);

  vigil::service::ServiceContext ctx;
  ctx.config_store = std::make_shared<vigil::sensors::SensorConfigStore>(db);
  ctx.config_store->EnsureDefaults();
  return std::make_shared<vigil::service::ConfigService>(ctx);
}

void TestExceptionsMapToStatusCodes() {
  using namespace vigil::util;
  using vigil::grpc::ToStatus;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(DecodeError("x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(StorageError("disk I/O error")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(StorageError("disk I/O error")).error_message() == "disk I/O error");
}

void TestRejectedConfigurationIsNotAnRpcError() {
  vigil::grpc::ConfigServer server(BuildConfigService());

  vigil::agent::v1::SetConfigRequest req;
  req.set_actor("tester");
  req.mutable_config()->mutable_etw()->set_level(42);

  vigil::agent::v1::SetConfigResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.SetConfig(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.success());
  assert(!resp.message().empty());
}

void TestUnknownAuditKindIsInvalidArgument() {
  vigil::grpc::ConfigServer server(BuildConfigService());

  vigil::agent::v1::ListConfigAuditRequest req;
  req.set_kind(static_cast<vigil::agent::v1::SensorKind>(9));

  vigil::agent::v1::ListConfigAuditResponse resp;
  ::grpc::ServerContext                     grpc_ctx;

  const auto status = server.ListConfigAudit(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestExceptionsMapToStatusCodes();
  TestRejectedConfigurationIsNotAnRpcError();
  TestUnknownAuditKindIsInvalidArgument();

  std::cout << "vigil_unit_grpc_status: pass\n";
  return 0;
}
