#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/config_audit_record.hpp"
#include "internal/model/event.hpp"
#include "vigil/agent/v1/sensor_config.pb.h"

namespace vigil::db {

/*
  Repository abstraction.

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Event rows are only ever inserted or deleted
  - config_audit rows are only ever inserted

  Each owner (store writer, config store) holds its own repository and
  therefore its own connection.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin()     = 0;
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Event tables
  // ---------------------------------------------------------------------

  virtual Result InsertEvents(Transaction&, vigil::model::ChannelKind, const std::vector<vigil::model::Event>&) = 0;

  virtual Result DeleteEventsBefore(Transaction&, vigil::model::ChannelKind, std::int64_t cutoff_micros, std::uint64_t& deleted) = 0;

  virtual Result PurgeEvents(Transaction&, vigil::model::ChannelKind, std::uint64_t& deleted) = 0;

  virtual std::optional<std::uint64_t> CountEvents(Transaction&, vigil::model::ChannelKind) = 0;

  // ---------------------------------------------------------------------
  // Sensor configuration (singleton rows, NotFound when absent)
  // ---------------------------------------------------------------------

  virtual Result LoadConfig(Transaction&, agent::v1::ScannerConfig&) = 0;
  virtual Result LoadConfig(Transaction&, agent::v1::ProcessConfig&) = 0;
  virtual Result LoadConfig(Transaction&, agent::v1::FsConfig&)      = 0;
  virtual Result LoadConfig(Transaction&, agent::v1::NetworkConfig&) = 0;
  virtual Result LoadConfig(Transaction&, agent::v1::EtwConfig&)     = 0;

  virtual Result SaveConfig(Transaction&, const agent::v1::ScannerConfig&) = 0;
  virtual Result SaveConfig(Transaction&, const agent::v1::ProcessConfig&) = 0;
  virtual Result SaveConfig(Transaction&, const agent::v1::FsConfig&)      = 0;
  virtual Result SaveConfig(Transaction&, const agent::v1::NetworkConfig&) = 0;
  virtual Result SaveConfig(Transaction&, const agent::v1::EtwConfig&)     = 0;

  // ---------------------------------------------------------------------
  // Config audit
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result AppendAudit(Transaction&, model::ConfigAuditRecord& record) = 0;

  // Newest first; all sensor types when sensor_type is empty.
  virtual std::vector<model::ConfigAuditRecord> ListAudit(Transaction&, const std::optional<std::string>& sensor_type, std::size_t limit) = 0;
};

} // namespace vigil::db
