#include "store_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vigil::store {

using observability::BoolField;
using observability::IntField;
using observability::StringField;
using observability::UintField;
using SteadyClock = std::chrono::steady_clock;

const char* ToString(WriterState state) {
  switch (state) {
    case WriterState::kOpen:
      return "open";
    case WriterState::kCheckpointing:
      return "checkpointing";
    case WriterState::kClosed:
      return "closed";
  }
  return "unknown";
}

StoreWriter::StoreWriter(std::shared_ptr<db::sqlite::SqliteDB> db, StoreWriterOptions options, FatalHandler on_fatal)
    : db_(std::move(db)), repo_(db_), options_(options), on_fatal_(std::move(on_fatal)) {
  if (options_.max_queued_events == 0) {
    throw util::InvalidArgument("writer queue bound must be positive");
  }
  if (options_.wal_size_limit_bytes == 0) {
    throw util::InvalidArgument("wal size limit must be positive");
  }
}

StoreWriter::~StoreWriter() {
  Stop();
}

void StoreWriter::Submit(pipeline::EventBatch&& batch) {
  if (batch.events.empty()) {
    return;
  }
  {
    std::lock_guard lock(queue_mutex_);
    queued_events_ += batch.events.size();
    queue_.push_back(std::move(batch));
    EnforceBoundLocked();
  }
  queue_cv_.notify_one();
}

void StoreWriter::EnforceBoundLocked() {
  std::uint64_t dropped = 0;
  while (queued_events_ > options_.max_queued_events && !queue_.empty()) {
    auto&             oldest = queue_.front();
    const std::size_t excess = queued_events_ - options_.max_queued_events;

    if (excess >= oldest.events.size()) {
      dropped += oldest.events.size();
      queued_events_ -= oldest.events.size();
      queue_.pop_front();
      continue;
    }

    oldest.events.erase(oldest.events.begin(), oldest.events.begin() + static_cast<std::ptrdiff_t>(excess));
    queued_events_ -= excess;
    dropped += excess;
  }

  if (dropped > 0) {
    dropped_events_.fetch_add(dropped, std::memory_order_relaxed);
    observability::Metrics::Instance().RecordQueueDrops(dropped);
    VIGIL_LOG_WARN("writer queue full, dropped oldest events",
                   {UintField("dropped", dropped), UintField("total_dropped", dropped_events_.load(std::memory_order_relaxed))});
  }
}

bool StoreWriter::CommitBatch(const pipeline::EventBatch& batch) {
  const auto table = model::TableName(batch.kind);
  const auto start = SteadyClock::now();

  try {
    auto tx = repo_.Begin();
    auto r  = repo_.InsertEvents(*tx, batch.kind, batch.events);
    if (!r) {
      VIGIL_LOG_WARN("batch insert failed", {StringField("table", table), StringField("code", db::ToString(r.code)), StringField("error", r.message)});
      return false;
    }
    tx->Commit();
  } catch (const util::StorageError& e) {
    VIGIL_LOG_WARN("batch commit failed", {StringField("table", table), StringField("error", e.what())});
    return false;
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
  observability::Metrics::Instance().ObserveStoreWriteMs(table, elapsed);
  return true;
}

bool StoreWriter::WriteNext() {
  pipeline::EventBatch batch;
  {
    std::lock_guard lock(queue_mutex_);
    if (queue_.empty()) {
      return false;
    }
    batch = std::move(queue_.front());
    queue_.pop_front();
    queued_events_ -= batch.events.size();
  }

  auto backoff = options_.write_retry_backoff;
  for (std::uint32_t attempt = 0;; ++attempt) {
    if (CommitBatch(batch)) {
      batches_written_.fetch_add(1, std::memory_order_relaxed);
      events_written_.fetch_add(batch.events.size(), std::memory_order_relaxed);
      CheckWalCap();
      return true;
    }

    write_failures_.fetch_add(1, std::memory_order_relaxed);
    if (attempt + 1 >= options_.write_retry_attempts) {
      break;
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }

  VIGIL_LOG_ERROR("batch write retries exhausted, keeping batch queued",
                  {StringField("table", model::TableName(batch.kind)), UintField("events", batch.events.size())});

  std::lock_guard lock(queue_mutex_);
  queued_events_ += batch.events.size();
  queue_.push_front(std::move(batch));
  EnforceBoundLocked();
  return false;
}

std::uint64_t StoreWriter::WalSizeBytes() const {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(db_->WalPath(), ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool StoreWriter::Checkpoint(bool forced) {
  state_ = WriterState::kCheckpointing;
  const auto result = db_->Checkpoint(SQLITE_CHECKPOINT_TRUNCATE);
  state_ = WriterState::kOpen;

  const bool ok = result.Complete();
  checkpoints_.fetch_add(1, std::memory_order_relaxed);
  if (forced) {
    forced_checkpoints_.fetch_add(1, std::memory_order_relaxed);
  }
  observability::Metrics::Instance().RecordCheckpoint(forced, ok);

  if (!ok) {
    checkpoint_failures_.fetch_add(1, std::memory_order_relaxed);
    VIGIL_LOG_WARN("wal checkpoint incomplete", {BoolField("forced", forced), IntField("rc", result.rc), IntField("log_frames", result.log_frames),
                                                 IntField("checkpointed_frames", result.checkpointed_frames),
                                                 StringField("error", sqlite3_errstr(result.rc))});
  }
  return ok;
}

void StoreWriter::CheckWalCap() {
  if (WalSizeBytes() < options_.wal_size_limit_bytes) {
    consecutive_forced_failures_ = 0;
    return;
  }

  if (Checkpoint(true) && WalSizeBytes() < options_.wal_size_limit_bytes) {
    consecutive_forced_failures_ = 0;
    return;
  }

  ++consecutive_forced_failures_;
  if (consecutive_forced_failures_ >= options_.max_forced_checkpoint_failures && !fatal_reported_) {
    fatal_reported_ = true;
    const std::string reason = "wal above size cap after " + std::to_string(consecutive_forced_failures_) + " forced checkpoints";
    VIGIL_LOG_CRITICAL("store writer cannot bound the wal", {StringField("reason", reason), UintField("wal_size_bytes", WalSizeBytes()),
                                                             UintField("limit_bytes", options_.wal_size_limit_bytes)});
    if (on_fatal_) {
      on_fatal_(reason);
    }
  }
}

std::uint64_t StoreWriter::RunRetention(util::TimePoint now) {
  if (options_.retention_ttl.count() <= 0) {
    return 0;
  }

  const auto    cutoff = util::ToUnixMicros(now - options_.retention_ttl);
  std::uint64_t total  = 0;

  for (auto kind : model::kAllChannelKinds) {
    const auto table = model::TableName(kind);
    try {
      auto          tx      = repo_.Begin();
      std::uint64_t deleted = 0;
      auto          r       = repo_.DeleteEventsBefore(*tx, kind, cutoff, deleted);
      if (!r) {
        VIGIL_LOG_WARN("retention delete failed", {StringField("table", table), StringField("error", r.message)});
        continue;
      }
      tx->Commit();
      total += deleted;
      if (deleted > 0) {
        observability::Metrics::Instance().RecordRetentionDeleted(table, deleted);
      }
    } catch (const util::StorageError& e) {
      VIGIL_LOG_WARN("retention delete failed", {StringField("table", table), StringField("error", e.what())});
    }
  }

  retention_deleted_.fetch_add(total, std::memory_order_relaxed);
  if (total > 0) {
    VIGIL_LOG_INFO("retention reaper deleted expired events", {UintField("rows", total), IntField("cutoff_us", cutoff)});
  }
  return total;
}

std::uint64_t StoreWriter::PurgeEvents() {
  auto          tx    = repo_.Begin();
  std::uint64_t total = 0;
  for (auto kind : model::kAllChannelKinds) {
    std::uint64_t deleted = 0;
    auto          r       = repo_.PurgeEvents(*tx, kind, deleted);
    if (!r) {
      throw util::StorageError("purge " + std::string(model::TableName(kind)) + ": " + r.message);
    }
    total += deleted;
  }
  tx->Commit();
  VIGIL_LOG_INFO("startup purge cleared event tables", {UintField("rows", total)});
  return total;
}

void StoreWriter::Start() {
  {
    std::lock_guard lock(queue_mutex_);
    stopping_ = false;
  }
  state_  = WriterState::kOpen;
  thread_ = std::thread(&StoreWriter::Loop, this);
}

void StoreWriter::Stop() {
  {
    std::lock_guard lock(queue_mutex_);
    stopping_ = true;
  }
  queue_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StoreWriter::Loop() {
  auto next_checkpoint = SteadyClock::now() + options_.checkpoint_interval;
  auto next_retention  = SteadyClock::now();

  while (true) {
    {
      std::unique_lock lock(queue_mutex_);
      const auto       wake = std::min(next_checkpoint, next_retention);
      queue_cv_.wait_until(lock, wake, [&] { return stopping_ || !queue_.empty(); });
      if (stopping_) {
        break;
      }
    }

    try {
      WriteNext();

      const auto now = SteadyClock::now();
      if (now >= next_checkpoint) {
        Checkpoint(false);
        next_checkpoint = now + options_.checkpoint_interval;
      }
      if (now >= next_retention) {
        RunRetention(util::Now());
        next_retention = now + options_.retention_interval;
      }
    } catch (const std::exception& e) {
      VIGIL_LOG_ERROR("store writer step failed", {StringField("error", e.what())});
    }
  }

  // Drain: one full retry cycle per batch, anything that still fails is dropped.
  while (true) {
    std::size_t remaining = 0;
    {
      std::lock_guard lock(queue_mutex_);
      remaining = queue_.size();
    }
    if (remaining == 0) {
      break;
    }
    try {
      if (!WriteNext()) {
        std::lock_guard lock(queue_mutex_);
        dropped_events_.fetch_add(queued_events_, std::memory_order_relaxed);
        VIGIL_LOG_ERROR("dropping queued events at shutdown", {UintField("events", queued_events_)});
        queue_.clear();
        queued_events_ = 0;
      }
    } catch (const std::exception& e) {
      VIGIL_LOG_ERROR("store writer drain failed", {StringField("error", e.what())});
      std::lock_guard lock(queue_mutex_);
      dropped_events_.fetch_add(queued_events_, std::memory_order_relaxed);
      queue_.clear();
      queued_events_ = 0;
    }
  }

  Checkpoint(false);
  state_ = WriterState::kClosed;
  VIGIL_LOG_INFO("store writer closed", {UintField("events_written", events_written_.load()), UintField("dropped_events", dropped_events_.load())});
}

WriterStats StoreWriter::Stats() const {
  WriterStats s;
  s.state = state_.load();
  {
    std::lock_guard lock(queue_mutex_);
    s.queued_events = queued_events_;
  }
  s.dropped_events      = dropped_events_.load(std::memory_order_relaxed);
  s.batches_written     = batches_written_.load(std::memory_order_relaxed);
  s.events_written      = events_written_.load(std::memory_order_relaxed);
  s.write_failures      = write_failures_.load(std::memory_order_relaxed);
  s.checkpoints         = checkpoints_.load(std::memory_order_relaxed);
  s.checkpoint_failures = checkpoint_failures_.load(std::memory_order_relaxed);
  s.forced_checkpoints  = forced_checkpoints_.load(std::memory_order_relaxed);
  s.retention_deleted   = retention_deleted_.load(std::memory_order_relaxed);
  s.wal_size_bytes      = WalSizeBytes();
  return s;
}

WriterState StoreWriter::State() const {
  return state_.load();
}

} // namespace vigil::store
