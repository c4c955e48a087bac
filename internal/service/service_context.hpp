#pragma once

#include <memory>

namespace vigil::sensors { class SensorConfigStore; }
namespace vigil::pipeline { class IngestPipeline; }
namespace vigil::store { class StoreWriter; }

namespace vigil::service {

/*
  Dependency container shared by all services.

  pipeline and writer may be null when a service is used without the
  ingestion side (tests, config-only tools).
*/
struct ServiceContext {
  std::shared_ptr<vigil::sensors::SensorConfigStore> config_store;
  std::shared_ptr<vigil::pipeline::IngestPipeline> pipeline;
  std::shared_ptr<vigil::store::StoreWriter> writer;
};

} // namespace vigil::service
