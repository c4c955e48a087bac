#include "sqlite_db.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include "internal/util/errors.hpp"

namespace vigil::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

constexpr std::array<std::string_view, 4> kSynchronousLevels = {"OFF", "NORMAL", "FULL", "EXTRA"};

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(std::move(options)) {
  if (std::find(kSynchronousLevels.begin(), kSynchronousLevels.end(), options_.synchronous) == kSynchronousLevels.end()) {
    throw util::InvalidArgument("unknown synchronous level: " + options_.synchronous);
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return Statement(stmt);
}

CheckpointResult SqliteDB::Checkpoint(int mode) {
  CheckpointResult result;
  result.rc = sqlite3_wal_checkpoint_v2(db_, nullptr, mode, &result.log_frames, &result.checkpointed_frames);
  return result;
}

void SqliteDB::Configure() {
  // WAL lets readers run while the writer holds its lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=" + options_.synchronous + ";");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  if (options_.manual_checkpoints) {
    Exec("PRAGMA wal_autocheckpoint=0;");
  }
  if (options_.journal_size_limit >= 0) {
    Exec("PRAGMA journal_size_limit=" + std::to_string(options_.journal_size_limit) + ";");
  }

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace vigil::db::sqlite
