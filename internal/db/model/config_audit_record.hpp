#pragma once

#include <cstdint>
#include <string>

namespace vigil::db::model {

// One row of config_audit. Rows are append-only.
struct ConfigAuditRecord {
  std::int64_t id            = 0;
  std::string  sensor_type;
  std::int64_t changed_at_ms = 0;
  std::string  actor;
  std::string  old_config;
  std::string  new_config;
};

} // namespace vigil::db::model
