#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/model/sensor_kind.hpp"
#include "internal/util/time.hpp"
#include "vigil/agent/v1/sensor_config.pb.h"

namespace vigil::sensors {

struct ApplyResult {
  // kinds whose stored configuration actually changed
  std::vector<model::SensorKind> changed;
  std::string                    message;
};

// Configuration seeded for a kind that has no row yet.
agent::v1::SensorConfigSnapshot DefaultSnapshot();

/*
  Current sensor configuration, one singleton row per kind, plus the
  append-only audit trail of every change.

  Apply() validates first and then writes the new rows and one audit
  entry per changed kind in a single transaction: either all of it is
  visible afterwards or none of it is.

  Uses its own connection, separate from the event writer.
*/
class SensorConfigStore {
 public:
  explicit SensorConfigStore(std::shared_ptr<db::sqlite::SqliteDB> db);

  // Inserts the default row for every kind that has none. Not audited.
  void EnsureDefaults();

  // All five rows read from one snapshot.
  agent::v1::SensorConfigSnapshot Snapshot();

  // Throws util::InvalidArgument when validation fails (nothing written)
  // and util::StorageError when the transaction fails (nothing written).
  ApplyResult Apply(const agent::v1::ConfigUpdate& update, const std::string& actor, util::TimePoint now = util::Now());

  // Newest first.
  std::vector<agent::v1::ConfigAuditEntry> ListAudit(std::optional<model::SensorKind> kind, std::size_t limit);

 private:
  std::mutex                            mutex_;
  std::shared_ptr<db::sqlite::SqliteDB> db_;
  db::sqlite::SqliteRepository          repo_;
};

} // namespace vigil::sensors
