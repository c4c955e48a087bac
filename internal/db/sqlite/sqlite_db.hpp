#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace vigil::db::sqlite {

struct SqliteOptions {
  // OFF | NORMAL | FULL | EXTRA
  std::string  synchronous     = "NORMAL";
  int          busy_timeout_ms = 5000;
  // bytes the WAL is truncated to after a checkpoint, -1 = no limit
  std::int64_t journal_size_limit = -1;
  // disables sqlite's own checkpoints; the owner runs Checkpoint()
  bool         manual_checkpoints = false;
};

struct CheckpointResult {
  int  rc                  = SQLITE_OK;
  int  log_frames          = 0;
  int  checkpointed_frames = 0;

  bool Complete() const {
    return rc == SQLITE_OK && log_frames == checkpointed_frames;
  }
};

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::string WalPath() const {
    return path_ + "-wal";
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Merges the WAL into the main file. TRUNCATE also resets the WAL to
  // zero bytes when every frame was copied.
  CheckpointResult Checkpoint(int mode = SQLITE_CHECKPOINT_TRUNCATE);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace vigil::db::sqlite
