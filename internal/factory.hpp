#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/pipeline/ingest_pipeline.hpp"
#include "internal/sensors/sensor_config_store.hpp"
#include "internal/store/store_writer.hpp"

namespace vigil::factory {

/*
  Application

  Owns all long-lived components of the agent.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::sqlite::SqliteDB> event_db;
  std::shared_ptr<db::sqlite::SqliteDB> config_db;

  std::shared_ptr<sensors::SensorConfigStore> config_store;
  std::shared_ptr<store::StoreWriter>         writer;
  std::shared_ptr<pipeline::IngestPipeline>   pipeline;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Writer first so no flushed batch finds it stopped.
  void Start();
  // Pipeline first: its final flush lands in the writer queue, which
  // the writer then drains before its last checkpoint.
  void Stop();
};

/*
  Build

  Constructs the entire agent based on runtime config: opens the
  database, bootstraps the schema, purges old events when asked to,
  seeds default sensor configuration and creates the ring channels.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const vigil::runtime::config::RuntimeConfig& config, store::StoreWriter::FatalHandler on_fatal = {});

} // namespace vigil::factory
