#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace vigil::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)) {
  db_->Exec(mode == Mode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    VIGIL_LOG_WARN("sqlite rollback failed", {observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace vigil::db::sqlite
