#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace vigil::db::sqlite {

/*
  SQLite transaction wrapper.

  kImmediate (writers) takes the write lock at BEGIN so a conflicting
  writer waits in busy_timeout instead of failing mid-transaction.
  kDeferred (readers) sees one WAL snapshot from its first read on.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kImmediate, kDeferred };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kImmediate);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
