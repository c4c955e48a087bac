#include "batcher.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vigil::pipeline {

Batcher::Batcher(BatchPolicy policy, BatchSink sink) : policy_(policy), sink_(std::move(sink)) {
  if (policy_.max_events == 0) {
    throw util::InvalidArgument("batch size must be positive");
  }
  if (policy_.flush_interval.count() <= 0) {
    throw util::InvalidArgument("flush interval must be positive");
  }
  if (!sink_) {
    throw util::InvalidArgument("batcher requires a sink");
  }
}

Batcher::~Batcher() {
  Stop();
}

void Batcher::Append(model::Event event, SteadyClock::time_point now) {
  const auto kind  = model::KindOf(event);
  auto&      table = tables_[model::IndexOf(kind)];

  bool opened = false;
  {
    std::lock_guard lock(table.mutex);
    if (!table.first_event) {
      table.first_event = now;
      opened            = true;
    }
    table.events.push_back(std::move(event));
    if (table.events.size() >= policy_.max_events) {
      FlushLocked(kind, table);
      opened = false;
    }
  }

  // A new batch may have an earlier deadline than the timer is waiting for.
  if (opened && running_) {
    std::lock_guard lock(wake_mutex_);
    wake_cv_.notify_one();
  }
}

std::size_t Batcher::FlushDue(SteadyClock::time_point now) {
  std::size_t flushed = 0;
  for (auto kind : model::kAllChannelKinds) {
    auto&           table = tables_[model::IndexOf(kind)];
    std::lock_guard lock(table.mutex);
    if (table.first_event && now - *table.first_event >= policy_.flush_interval) {
      flushed += FlushLocked(kind, table);
    }
  }
  return flushed;
}

std::size_t Batcher::FlushAll() {
  std::size_t flushed = 0;
  for (auto kind : model::kAllChannelKinds) {
    auto&           table = tables_[model::IndexOf(kind)];
    std::lock_guard lock(table.mutex);
    flushed += FlushLocked(kind, table);
  }
  return flushed;
}

std::optional<Batcher::SteadyClock::time_point> Batcher::NextDeadline() const {
  std::optional<SteadyClock::time_point> next;
  for (const auto& table : tables_) {
    std::lock_guard lock(table.mutex);
    if (table.first_event) {
      const auto deadline = *table.first_event + policy_.flush_interval;
      next                = next ? std::min(*next, deadline) : deadline;
    }
  }
  return next;
}

std::size_t Batcher::PendingEvents() const {
  std::size_t pending = 0;
  for (const auto& table : tables_) {
    std::lock_guard lock(table.mutex);
    pending += table.events.size();
  }
  return pending;
}

std::size_t Batcher::FlushLocked(model::ChannelKind kind, Table& table) {
  table.first_event.reset();
  if (table.events.empty()) {
    return 0;
  }

  EventBatch batch;
  batch.kind = kind;
  batch.events.swap(table.events);
  table.events.reserve(std::min<std::size_t>(policy_.max_events, 4096));

  const auto count = batch.events.size();
  observability::Metrics::Instance().RecordBatchFlush(model::TableName(kind), count);
  sink_(std::move(batch));
  return count;
}

void Batcher::Start() {
  running_ = true;
  thread_  = std::thread(&Batcher::Loop, this);
}

void Batcher::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    FlushAll();
  }
}

void Batcher::Loop() {
  while (running_) {
    try {
      FlushDue(SteadyClock::now());
    } catch (const std::exception& e) {
      VIGIL_LOG_ERROR("batch flush failed", {observability::StringField("error", e.what())});
    }

    const auto deadline = NextDeadline().value_or(SteadyClock::now() + policy_.flush_interval);
    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_until(lock, deadline, [&] { return !running_ || NextDeadline().value_or(deadline) < deadline; });
  }
}

} // namespace vigil::pipeline
