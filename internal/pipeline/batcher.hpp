#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "event_batch.hpp"

namespace vigil::pipeline {

struct BatchPolicy {
  std::size_t               max_events = 500;
  std::chrono::milliseconds flush_interval{1000};
};

/*
  Per-table accumulator between the drain workers and the store writer.

  A table's batch is handed to the sink when it reaches max_events, or
  once flush_interval has elapsed since its first event, whichever comes
  first. Empty batches are never emitted.

  Each table has its own lock; the sink runs under that lock so batches
  of one table reach the sink in the order their events arrived.
*/
class Batcher {
 public:
  using SteadyClock = std::chrono::steady_clock;

  Batcher(BatchPolicy policy, BatchSink sink);
  ~Batcher();

  Batcher(const Batcher&)            = delete;
  Batcher& operator=(const Batcher&) = delete;

  void Append(model::Event event, SteadyClock::time_point now = SteadyClock::now());

  // Flushes every batch whose interval has elapsed. Returns events flushed.
  std::size_t FlushDue(SteadyClock::time_point now = SteadyClock::now());
  std::size_t FlushAll();

  std::optional<SteadyClock::time_point> NextDeadline() const;
  std::size_t                            PendingEvents() const;

  const BatchPolicy& Policy() const {
    return policy_;
  }

  // Background timer that runs FlushDue. Stop() flushes everything pending.
  void Start();
  void Stop();

 private:
  struct Table {
    mutable std::mutex                     mutex;
    std::vector<model::Event>              events;
    std::optional<SteadyClock::time_point> first_event;
  };

  std::size_t FlushLocked(model::ChannelKind kind, Table& table);
  void        Loop();

  BatchPolicy policy_;
  BatchSink   sink_;

  std::array<Table, model::kChannelKindCount> tables_;

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace vigil::pipeline
