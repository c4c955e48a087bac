#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/pipeline/event_batch.hpp"
#include "internal/util/time.hpp"

namespace vigil::store {

struct StoreWriterOptions {
  std::size_t               max_queued_events    = 100000;
  std::uint32_t             write_retry_attempts = 5;
  // first retry delay, doubled per attempt
  std::chrono::milliseconds write_retry_backoff{50};
  std::chrono::milliseconds checkpoint_interval{30000};
  std::uint64_t             wal_size_limit_bytes = 64ull << 20;
  // zero disables the retention reaper
  std::chrono::seconds      retention_ttl{7 * 24 * 3600};
  std::chrono::milliseconds retention_interval{60000};
  // forced checkpoints allowed to fail in a row while the WAL is over its cap
  std::uint32_t             max_forced_checkpoint_failures = 5;
};

enum class WriterState : std::uint8_t {
  kOpen,
  kCheckpointing,
  kClosed,
};

const char* ToString(WriterState state);

struct WriterStats {
  WriterState   state               = WriterState::kOpen;
  std::uint64_t queued_events       = 0;
  std::uint64_t dropped_events      = 0;
  std::uint64_t batches_written     = 0;
  std::uint64_t events_written      = 0;
  std::uint64_t write_failures      = 0;
  std::uint64_t checkpoints         = 0;
  std::uint64_t checkpoint_failures = 0;
  std::uint64_t forced_checkpoints  = 0;
  std::uint64_t retention_deleted   = 0;
  std::uint64_t wal_size_bytes      = 0;
};

/*
  The only writer of the event tables.

  Batches are queued by Submit() and committed one transaction per batch
  on the writer thread. Checkpoints, the WAL size cap and the retention
  reaper also run on that thread, so one connection owns every write.

  The queue bound counts queued events; when it is exceeded the oldest
  queued events are dropped and counted. A batch whose commit keeps
  failing stays at the head of the queue.

      Open -> Checkpointing -> Open     (interval or WAL cap)
      Open -> Closed                    (Stop, after a final checkpoint)
*/
class StoreWriter {
 public:
  using FatalHandler = std::function<void(const std::string& reason)>;

  StoreWriter(std::shared_ptr<db::sqlite::SqliteDB> db, StoreWriterOptions options, FatalHandler on_fatal = {});
  ~StoreWriter();

  StoreWriter(const StoreWriter&)            = delete;
  StoreWriter& operator=(const StoreWriter&) = delete;

  // Never blocks on the database.
  void Submit(pipeline::EventBatch&& batch);

  void Start();
  // Drains the queue, runs a final checkpoint and closes.
  void Stop();

  // Single steps of the writer loop. Outside tests they are only called
  // from the writer thread.
  bool          WriteNext();
  bool          Checkpoint(bool forced);
  std::uint64_t RunRetention(util::TimePoint now);
  std::uint64_t PurgeEvents();

  WriterStats   Stats() const;
  WriterState   State() const;
  std::uint64_t WalSizeBytes() const;

 private:
  bool CommitBatch(const pipeline::EventBatch& batch);
  void EnforceBoundLocked();
  void CheckWalCap();
  void Loop();

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  db::sqlite::SqliteRepository          repo_;
  StoreWriterOptions                    options_;
  FatalHandler                          on_fatal_;

  mutable std::mutex               queue_mutex_;
  std::condition_variable          queue_cv_;
  std::deque<pipeline::EventBatch> queue_;
  std::size_t                      queued_events_ = 0;
  bool                             stopping_      = false;

  std::atomic<WriterState>   state_{WriterState::kOpen};
  std::atomic<std::uint64_t> dropped_events_{0};
  std::atomic<std::uint64_t> batches_written_{0};
  std::atomic<std::uint64_t> events_written_{0};
  std::atomic<std::uint64_t> write_failures_{0};
  std::atomic<std::uint64_t> checkpoints_{0};
  std::atomic<std::uint64_t> checkpoint_failures_{0};
  std::atomic<std::uint64_t> forced_checkpoints_{0};
  std::atomic<std::uint64_t> retention_deleted_{0};

  std::uint32_t consecutive_forced_failures_ = 0;
  bool          fatal_reported_              = false;

  std::thread thread_;
};

} // namespace vigil::store
