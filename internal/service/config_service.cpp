#include "config_service.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sensors/sensor_config_store.hpp"
#include "internal/util/errors.hpp"

namespace vigil::service {

using namespace vigil::agent::v1;
using observability::StringField;

namespace {

class RequestScope {
 public:
  explicit RequestScope(const char* route) : route_(route), span_(route), started_at_(std::chrono::steady_clock::now()) {
  }

  void Finish(bool success) {
    observability::Metrics::Instance().RecordRequest(route_, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route_, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at_).count());
  }

  void Fail(const std::exception& ex) {
    span_.RecordException(ex.what());
    VIGIL_LOG_ERROR("RPC failed", {StringField("route", route_), StringField("error", ex.what())});
    Finish(false);
  }

  observability::SpanScope& Span() {
    return span_;
  }

 private:
  const char*                           route_;
  observability::SpanScope              span_;
  std::chrono::steady_clock::time_point started_at_;
};

} // namespace

std::string ResolveActor(const SetConfigRequest& req, std::string_view metadata_actor, std::string_view peer) {
  if (!req.actor().empty()) {
    return req.actor();
  }
  if (!metadata_actor.empty()) {
    return std::string(metadata_actor);
  }
  if (!peer.empty()) {
    return std::string(peer);
  }
  return "unknown";
}

ConfigService::ConfigService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetConfigResponse ConfigService::GetConfig(const GetConfigRequest&) {
  RequestScope scope("ConfigService.GetConfig");
  try {
    auto snapshot = ctx_.config_store->Snapshot();

    GetConfigResponse resp;
    *resp.mutable_scanner() = std::move(*snapshot.mutable_scanner());
    *resp.mutable_process() = std::move(*snapshot.mutable_process());
    *resp.mutable_fs()      = std::move(*snapshot.mutable_fs());
    *resp.mutable_network() = std::move(*snapshot.mutable_network());
    *resp.mutable_etw()     = std::move(*snapshot.mutable_etw());

    scope.Finish(true);
    return resp;
  } catch (const std::exception& ex) {
    scope.Fail(ex);
    throw;
  }
}

SetConfigResponse ConfigService::SetConfig(const SetConfigRequest& req, const std::string& actor) {
  RequestScope scope("ConfigService.SetConfig");
  scope.Span().SetAttribute("actor", actor);

  SetConfigResponse resp;
  try {
    auto result = ctx_.config_store->Apply(req.config(), actor);
    resp.set_success(true);
    resp.set_message(result.message);
    scope.Finish(true);
    return resp;
  } catch (const util::InvalidArgument& ex) {
    VIGIL_LOG_WARN("configuration rejected", {StringField("actor", actor), StringField("reason", ex.what())});
    resp.set_success(false);
    resp.set_message(ex.what());
    scope.Finish(false);
    return resp;
  } catch (const std::exception& ex) {
    scope.Fail(ex);
    throw;
  }
}

ListConfigAuditResponse ConfigService::ListConfigAudit(const ListConfigAuditRequest& req) {
  RequestScope scope("ConfigService.ListConfigAudit");
  try {
    std::optional<model::SensorKind> kind;
    if (req.kind() != SENSOR_KIND_UNSPECIFIED) {
      if (req.kind() < SENSOR_KIND_SCANNER || req.kind() > SENSOR_KIND_ETW) {
        throw util::InvalidArgument("unknown sensor kind");
      }
      kind = static_cast<model::SensorKind>(req.kind());
    }
    const std::size_t limit = req.limit() == 0 ? kDefaultAuditLimit : std::min<std::size_t>(req.limit(), kMaxAuditLimit);

    ListConfigAuditResponse resp;
    for (auto& entry : ctx_.config_store->ListAudit(kind, limit)) {
      *resp.add_entries() = std::move(entry);
    }
    scope.Finish(true);
    return resp;
  } catch (const std::exception& ex) {
    scope.Fail(ex);
    throw;
  }
}

} // namespace vigil::service
