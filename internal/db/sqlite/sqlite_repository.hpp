#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vigil::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertEvents(Transaction&, vigil::model::ChannelKind, const std::vector<vigil::model::Event>&) override;
  Result DeleteEventsBefore(Transaction&, vigil::model::ChannelKind, std::int64_t cutoff_micros, std::uint64_t& deleted) override;
  Result PurgeEvents(Transaction&, vigil::model::ChannelKind, std::uint64_t& deleted) override;
  std::optional<std::uint64_t> CountEvents(Transaction&, vigil::model::ChannelKind) override;

  Result LoadConfig(Transaction&, agent::v1::ScannerConfig&) override;
  Result LoadConfig(Transaction&, agent::v1::ProcessConfig&) override;
  Result LoadConfig(Transaction&, agent::v1::FsConfig&) override;
  Result LoadConfig(Transaction&, agent::v1::NetworkConfig&) override;
  Result LoadConfig(Transaction&, agent::v1::EtwConfig&) override;

  Result SaveConfig(Transaction&, const agent::v1::ScannerConfig&) override;
  Result SaveConfig(Transaction&, const agent::v1::ProcessConfig&) override;
  Result SaveConfig(Transaction&, const agent::v1::FsConfig&) override;
  Result SaveConfig(Transaction&, const agent::v1::NetworkConfig&) override;
  Result SaveConfig(Transaction&, const agent::v1::EtwConfig&) override;

  Result AppendAudit(Transaction&, model::ConfigAuditRecord& record) override;
  std::vector<model::ConfigAuditRecord> ListAudit(Transaction&, const std::optional<std::string>& sensor_type, std::size_t limit) override;

  const std::shared_ptr<SqliteDB>& Database() const { return db_; }

  static Result Translate(sqlite3* db, int rc);

private:
  static SqliteTransaction& TX(Transaction& t);

  std::shared_ptr<SqliteDB> db_;
};

}
