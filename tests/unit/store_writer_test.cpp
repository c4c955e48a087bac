#include "internal/store/store_writer.hpp"

#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/schema.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"

namespace {

using namespace std::chrono_literals;
using vigil::db::sqlite::SqliteDB;
using vigil::db::sqlite::SqliteOptions;
using vigil::model::ChannelKind;
using vigil::pipeline::EventBatch;
using vigil::store::StoreWriter;
using vigil::store::StoreWriterOptions;
using vigil::store::WriterState;

std::string FreshDbPath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "vigil_store_writer_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / (test_name + "-" + std::to_string(::getpid()) + ".db")).string();
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }
  return path;
}

std::shared_ptr<SqliteDB> OpenWriterDb(const std::string& path, int busy_timeout_ms = 5000) {
  SqliteOptions options;
  options.manual_checkpoints = true;
  options.busy_timeout_ms    = busy_timeout_ms;
  auto db                    = std::make_shared<SqliteDB>(path, options);
  vigil::db::sqlite::BootstrapSchema(db);
  return db;
}

EventBatch FileBatch(std::size_t n, vigil::util::TimePoint at = vigil::util::Now(), std::uint32_t first_pid = 1) {
  EventBatch batch;
  batch.kind = ChannelKind::kFilesystem;
  for (std::size_t i = 0; i < n; ++i) {
    vigil::model::Event event;
    event.timestamp = vigil::util::FromUnixMicros(vigil::util::ToUnixMicros(at));
    event.sensor_id = "fs";
    event.pid       = first_pid + static_cast<std::uint32_t>(i);
    event.exe_path  = "/usr/bin/touch";

    vigil::model::FileEvent file;
    file.path    = "/tmp/file" + std::to_string(i);
    event.payload = file;
    batch.events.push_back(std::move(event));
  }
  return batch;
}

std::uint64_t CountRows(const std::string& path, ChannelKind kind) {
  vigil::db::sqlite::SqliteRepository repo(std::make_shared<SqliteDB>(path));
  auto                                tx    = repo.BeginRead();
  const auto                          count = repo.CountEvents(*tx, kind);
  tx->Commit();
  assert(count.has_value());
  return *count;
}

void TestBatchIsCommittedInOneStep() {
  const auto  path = FreshDbPath("commit");
  StoreWriter writer(OpenWriterDb(path), StoreWriterOptions{});

  writer.Submit(FileBatch(25));
  assert(writer.Stats().queued_events == 25);

  assert(writer.WriteNext());
  assert(!writer.WriteNext());

  const auto stats = writer.Stats();
  assert(stats.queued_events == 0);
  assert(stats.batches_written == 1);
  assert(stats.events_written == 25);
  assert(CountRows(path, ChannelKind::kFilesystem) == 25);
}

void TestQueueBoundDropsOldestEvents() {
  const auto         path = FreshDbPath("bound");
  StoreWriterOptions options;
  options.max_queued_events = 5;
  StoreWriter writer(OpenWriterDb(path), options);

  writer.Submit(FileBatch(3, vigil::util::Now(), 1));
  writer.Submit(FileBatch(4, vigil::util::Now(), 100));

  auto stats = writer.Stats();
  assert(stats.queued_events == 5);
  assert(stats.dropped_events == 2);

  while (writer.WriteNext()) {
  }

  // pid 1 and 2 were the oldest and are gone
  vigil::db::sqlite::SqliteRepository repo(std::make_shared<SqliteDB>(path));
  auto tx = repo.BeginRead();
  assert(repo.CountEvents(*tx, ChannelKind::kFilesystem) == 5u);
  tx->Commit();

  auto reader = std::make_shared<SqliteDB>(path);
  auto stmt   = reader->Prepare("SELECT MIN(pid) FROM fs_events;");
  assert(sqlite3_step(stmt.get()) == SQLITE_ROW);
  assert(sqlite3_column_int(stmt.get(), 0) == 3);
}

void TestRetentionDeletesOnlyExpiredRows() {
  const auto         path = FreshDbPath("retention");
  StoreWriterOptions options;
  options.retention_ttl = std::chrono::seconds(3600);
  StoreWriter writer(OpenWriterDb(path), options);

  const auto now = vigil::util::FromUnixMicros(vigil::util::ToUnixMicros(vigil::util::Now()));
  writer.Submit(FileBatch(4, now - 2h));
  writer.Submit(FileBatch(6, now - 10min));
  // exactly at the cutoff stays, one microsecond older goes
  writer.Submit(FileBatch(2, now - 1h));
  writer.Submit(FileBatch(3, now - 1h - 1us));
  while (writer.WriteNext()) {
  }

  assert(writer.RunRetention(now) == 7);
  assert(CountRows(path, ChannelKind::kFilesystem) == 8);
  assert(writer.Stats().retention_deleted == 7);

  // nothing left to expire
  assert(writer.RunRetention(now) == 0);
}

void TestFailedCommitKeepsBatchAtHeadOfQueue() {
  const auto         path = FreshDbPath("write_failure");
  StoreWriterOptions options;
  options.write_retry_attempts = 2;
  options.write_retry_backoff  = 1ms;
  StoreWriter writer(OpenWriterDb(path, 10), options);

  // another connection holds the write lock
  auto blocker = std::make_shared<SqliteDB>(path);
  blocker->Exec("BEGIN IMMEDIATE;");

  writer.Submit(FileBatch(5, vigil::util::Now(), 1));
  writer.Submit(FileBatch(3, vigil::util::Now(), 100));
  assert(!writer.WriteNext());

  auto stats = writer.Stats();
  assert(stats.write_failures == 2);
  assert(stats.queued_events == 8);
  assert(stats.batches_written == 0);
  assert(stats.dropped_events == 0);

  blocker->Exec("COMMIT;");

  assert(writer.WriteNext());
  stats = writer.Stats();
  assert(stats.events_written == 5);
  assert(stats.queued_events == 3);

  // the failed batch went first
  auto reader = std::make_shared<SqliteDB>(path);
  auto stmt   = reader->Prepare("SELECT MIN(pid), MAX(pid) FROM fs_events;");
  assert(sqlite3_step(stmt.get()) == SQLITE_ROW);
  assert(sqlite3_column_int(stmt.get(), 0) == 1);
  assert(sqlite3_column_int(stmt.get(), 1) == 5);

  assert(writer.WriteNext());
  assert(CountRows(path, ChannelKind::kFilesystem) == 8);
}

void TestZeroTtlDisablesRetention() {
  const auto         path = FreshDbPath("retention_off");
  StoreWriterOptions options;
  options.retention_ttl = std::chrono::seconds(0);
  StoreWriter writer(OpenWriterDb(path), options);

  writer.Submit(FileBatch(3, vigil::util::Now() - 24h * 365));
  writer.WriteNext();
  assert(writer.RunRetention(vigil::util::Now()) == 0);
  assert(CountRows(path, ChannelKind::kFilesystem) == 3);
}

void TestPurgeClearsEveryEventTable() {
  const auto  path = FreshDbPath("purge");
  StoreWriter writer(OpenWriterDb(path), StoreWriterOptions{});

  auto network = FileBatch(2);
  network.kind = ChannelKind::kNetwork;
  for (auto& event : network.events) {
    event.payload = vigil::model::NetworkEvent{};
  }
  writer.Submit(FileBatch(5));
  writer.Submit(std::move(network));
  while (writer.WriteNext()) {
  }

  assert(writer.PurgeEvents() == 7);
  assert(CountRows(path, ChannelKind::kFilesystem) == 0);
  assert(CountRows(path, ChannelKind::kNetwork) == 0);
}

void TestCheckpointTruncatesTheWal() {
  const auto  path = FreshDbPath("checkpoint");
  StoreWriter writer(OpenWriterDb(path), StoreWriterOptions{});

  writer.Submit(FileBatch(200));
  writer.WriteNext();
  assert(writer.WalSizeBytes() > 0);

  assert(writer.Checkpoint(false));
  assert(writer.WalSizeBytes() == 0);
  assert(writer.Stats().checkpoints == 1);
  assert(writer.State() == WriterState::kOpen);
}

void TestWalCapForcesCheckpoint() {
  const auto         path = FreshDbPath("wal_cap");
  StoreWriterOptions options;
  options.wal_size_limit_bytes = 1;
  StoreWriter writer(OpenWriterDb(path), options);

  writer.Submit(FileBatch(50));
  writer.WriteNext();

  const auto stats = writer.Stats();
  assert(stats.forced_checkpoints == 1);
  assert(stats.checkpoint_failures == 0);
  assert(stats.wal_size_bytes == 0);
}

void TestStuckWalIsReportedAsFatalOnce() {
  const auto         path = FreshDbPath("wal_stuck");
  StoreWriterOptions options;
  options.wal_size_limit_bytes           = 1;
  options.max_forced_checkpoint_failures = 2;

  int         fatal_calls = 0;
  StoreWriter writer(OpenWriterDb(path, 10), options, [&](const std::string&) { ++fatal_calls; });

  // an open read snapshot pins the WAL
  auto reader = std::make_shared<SqliteDB>(path);
  reader->Exec("BEGIN;");
  reader->Exec("SELECT COUNT(*) FROM fs_events;");

  for (int i = 0; i < 3; ++i) {
    writer.Submit(FileBatch(10));
    assert(writer.WriteNext());
  }

  assert(fatal_calls == 1);
  assert(writer.Stats().checkpoint_failures >= 2);

  reader->Exec("COMMIT;");
}

void TestStopWritesQueuedBatchesAndCloses() {
  const auto  path = FreshDbPath("stop");
  StoreWriter writer(OpenWriterDb(path), StoreWriterOptions{});
  writer.Start();

  for (int i = 0; i < 10; ++i) {
    writer.Submit(FileBatch(10));
  }
  writer.Stop();

  const auto stats = writer.Stats();
  assert(stats.state == WriterState::kClosed);
  assert(stats.events_written == 100);
  assert(stats.queued_events == 0);
  assert(CountRows(path, ChannelKind::kFilesystem) == 100);
}

} // namespace

int main() {
  TestBatchIsCommittedInOneStep();
  TestQueueBoundDropsOldestEvents();
  TestRetentionDeletesOnlyExpiredRows();
  TestFailedCommitKeepsBatchAtHeadOfQueue();
  TestZeroTtlDisablesRetention();
  TestPurgeClearsEveryEventTable();
  TestCheckpointTruncatesTheWal();
  TestWalCapForcesCheckpoint();
  TestStuckWalIsReportedAsFatalOnce();
  TestStopWritesQueuedBatchesAndCloses();

  std::cout << "vigil_unit_store_writer: pass\n";
  return 0;
}
