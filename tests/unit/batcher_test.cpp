#include "internal/pipeline/batcher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using vigil::model::ChannelKind;
using vigil::pipeline::BatchPolicy;
using vigil::pipeline::Batcher;
using vigil::pipeline::EventBatch;

struct Collector {
  std::mutex              mutex;
  std::vector<EventBatch> batches;

  vigil::pipeline::BatchSink Sink() {
    return [this](EventBatch&& batch) {
      std::lock_guard lock(mutex);
      batches.push_back(std::move(batch));
    };
  }

  std::size_t Count() {
    std::lock_guard lock(mutex);
    return batches.size();
  }
};

vigil::model::Event FileEvent(std::uint32_t pid) {
  vigil::model::Event event;
  event.pid     = pid;
  event.payload = vigil::model::FileEvent{};
  return event;
}

vigil::model::Event NetworkEvent(std::uint32_t pid) {
  vigil::model::Event event;
  event.pid     = pid;
  event.payload = vigil::model::NetworkEvent{};
  return event;
}

void TestBatchIsEmittedAtMaxEventsInArrivalOrder() {
  Collector collector;
  Batcher   batcher(BatchPolicy{3, 1000ms}, collector.Sink());

  const auto now = Batcher::SteadyClock::now();
  batcher.Append(FileEvent(1), now);
  batcher.Append(FileEvent(2), now);
  assert(collector.Count() == 0);
  batcher.Append(FileEvent(3), now);

  assert(collector.Count() == 1);
  const auto& batch = collector.batches[0];
  assert(batch.kind == ChannelKind::kFilesystem);
  assert(batch.events.size() == 3);
  assert(batch.events[0].pid == 1 && batch.events[1].pid == 2 && batch.events[2].pid == 3);
  assert(batcher.PendingEvents() == 0);
  assert(!batcher.NextDeadline().has_value());
}

void TestBatchIsEmittedWhenIntervalElapses() {
  Collector collector;
  Batcher   batcher(BatchPolicy{500, 1000ms}, collector.Sink());

  const auto t0 = Batcher::SteadyClock::now();
  batcher.Append(FileEvent(1), t0);
  batcher.Append(FileEvent(2), t0 + 400ms);
  assert(batcher.NextDeadline() == t0 + 1000ms);

  assert(batcher.FlushDue(t0 + 999ms) == 0);
  assert(collector.Count() == 0);

  assert(batcher.FlushDue(t0 + 1000ms) == 2);
  assert(collector.Count() == 1);
  assert(collector.batches[0].events.size() == 2);
}

void TestTablesAreBatchedIndependently() {
  Collector collector;
  Batcher   batcher(BatchPolicy{2, 1000ms}, collector.Sink());

  const auto now = Batcher::SteadyClock::now();
  batcher.Append(FileEvent(1), now);
  batcher.Append(NetworkEvent(2), now);
  assert(collector.Count() == 0);
  assert(batcher.PendingEvents() == 2);

  batcher.Append(NetworkEvent(3), now);
  assert(collector.Count() == 1);
  assert(collector.batches[0].kind == ChannelKind::kNetwork);

  assert(batcher.FlushAll() == 1);
  assert(collector.Count() == 2);
  assert(collector.batches[1].kind == ChannelKind::kFilesystem);
}

void TestEmptyBatchesAreNeverEmitted() {
  Collector collector;
  Batcher   batcher(BatchPolicy{10, 10ms}, collector.Sink());

  assert(batcher.FlushAll() == 0);
  assert(batcher.FlushDue(Batcher::SteadyClock::now() + 1h) == 0);
  assert(collector.Count() == 0);
}

void TestInvalidPolicyIsRejected() {
  Collector collector;
  bool      threw = false;
  try {
    Batcher batcher(BatchPolicy{0, 1000ms}, collector.Sink());
  } catch (const vigil::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Batcher batcher(BatchPolicy{10, 0ms}, collector.Sink());
  } catch (const vigil::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestTimerFlushesInBackground() {
  Collector collector;
  Batcher   batcher(BatchPolicy{500, 20ms}, collector.Sink());
  batcher.Start();

  batcher.Append(FileEvent(1));

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (collector.Count() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  assert(collector.Count() == 1);
  batcher.Stop();
}

void TestStopFlushesPendingEvents() {
  Collector collector;
  Batcher   batcher(BatchPolicy{500, 1h}, collector.Sink());
  batcher.Start();

  batcher.Append(FileEvent(1));
  batcher.Append(NetworkEvent(2));
  batcher.Stop();

  assert(collector.Count() == 2);
  assert(batcher.PendingEvents() == 0);
}

} // namespace

int main() {
  TestBatchIsEmittedAtMaxEventsInArrivalOrder();
  TestBatchIsEmittedWhenIntervalElapses();
  TestTablesAreBatchedIndependently();
  TestEmptyBatchesAreNeverEmitted();
  TestInvalidPolicyIsRejected();
  TestTimerFlushesInBackground();
  TestStopFlushesPendingEvents();

  std::cout << "vigil_unit_batcher: pass\n";
  return 0;
}
