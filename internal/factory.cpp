#include "factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/config_server.hpp"
#include "internal/model/channel_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ring/ring_channel.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/config_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace vigil::factory {

using namespace vigil;
using observability::StringField;
using observability::UintField;

namespace {

db::sqlite::SqliteOptions EventDbOptions(const vigil::runtime::config::DatabaseConfig& database) {
  db::sqlite::SqliteOptions options;
  options.synchronous        = database.synchronous();
  options.busy_timeout_ms    = static_cast<int>(database.busy_timeout_ms());
  options.manual_checkpoints = true;
  return options;
}

store::StoreWriterOptions WriterOptions(const vigil::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  const auto& pipeline = config.pipeline();

  store::StoreWriterOptions options;
  options.max_queued_events              = pipeline.max_queued_events();
  options.write_retry_attempts           = pipeline.write_retry_attempts();
  options.write_retry_backoff            = std::chrono::milliseconds(pipeline.write_retry_backoff_ms());
  options.checkpoint_interval            = std::chrono::milliseconds(database.checkpoint_interval_ms());
  options.wal_size_limit_bytes           = database.wal_size_limit_bytes();
  options.retention_ttl                  = std::chrono::seconds(database.retention_ttl_seconds());
  options.retention_interval             = std::chrono::milliseconds(database.retention_interval_ms());
  options.max_forced_checkpoint_failures = database.max_forced_checkpoint_failures();
  return options;
}

std::vector<std::unique_ptr<ring::RingChannel>> BuildChannels(const vigil::runtime::config::ChannelsConfig& channels) {
  std::vector<model::ChannelKind> kinds;
  if (channels.kinds().empty()) {
    kinds.assign(model::kAllChannelKinds.begin(), model::kAllChannelKinds.end());
  } else {
    for (const auto& name : channels.kinds()) {
      const auto kind = model::ParseChannelKind(name);
      if (!kind) {
        throw util::InvalidArgument("unknown channel kind: " + name);
      }
      kinds.push_back(*kind);
    }
  }

  std::vector<std::unique_ptr<ring::RingChannel>> out;
  for (auto kind : kinds) {
    const auto name = ring::ChannelName(channels.name_prefix(), kind);
    out.push_back(ring::RingChannel::Create(kind, name, channels.size_bytes()));
    VIGIL_LOG_INFO("ring channel created", {StringField("channel", name), UintField("size_bytes", channels.size_bytes())});
  }
  return out;
}

} // namespace

void Application::Start() {
  writer->Start();
  pipeline->Start();
}

void Application::Stop() {
  pipeline->Stop();
  writer->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const vigil::runtime::config::RuntimeConfig& config, store::StoreWriter::FatalHandler on_fatal) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  const auto& database = config.database();

  app.event_db = std::make_shared<db::sqlite::SqliteDB>(database.path(), EventDbOptions(database));
  db::sqlite::BootstrapSchema(app.event_db);

  app.writer = std::make_shared<store::StoreWriter>(app.event_db, WriterOptions(config), std::move(on_fatal));
  if (database.purge_on_start()) {
    const auto purged = app.writer->PurgeEvents();
    VIGIL_LOG_INFO("purged stored events", {UintField("rows", purged)});
  }

  db::sqlite::SqliteOptions config_options;
  config_options.synchronous     = database.synchronous();
  config_options.busy_timeout_ms = static_cast<int>(database.busy_timeout_ms());
  app.config_db                  = std::make_shared<db::sqlite::SqliteDB>(database.path(), config_options);

  app.config_store = std::make_shared<sensors::SensorConfigStore>(app.config_db);
  app.config_store->EnsureDefaults();

  // ------------------------------------------------------------------
  // Ingestion
  // ------------------------------------------------------------------
  pipeline::BatchPolicy policy;
  policy.max_events     = config.pipeline().batch_size();
  policy.flush_interval = std::chrono::milliseconds(config.pipeline().flush_interval_ms());

  pipeline::DrainOptions drain;
  drain.max_backoff   = std::chrono::milliseconds(config.pipeline().poll_backoff_max_ms());
  drain.drain_timeout = std::chrono::milliseconds(config.pipeline().drain_timeout_ms());
  if (drain.max_backoff < drain.min_backoff) {
    drain.max_backoff = drain.min_backoff;
  }

  auto writer  = app.writer;
  app.pipeline = std::make_shared<pipeline::IngestPipeline>(BuildChannels(config.channels()), policy, drain,
                                                            [writer](pipeline::EventBatch&& batch) { writer->Submit(std::move(batch)); });

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.config_store = app.config_store;
  ctx.pipeline     = app.pipeline;
  ctx.writer       = app.writer;

  auto config_service = std::make_shared<service::ConfigService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ConfigServer>(config_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace vigil::factory
