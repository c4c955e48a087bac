#include "internal/pipeline/drain_worker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/codec/event_codec.hpp"
#include "internal/ring/ring_channel.hpp"

namespace {

using namespace std::chrono_literals;
using vigil::model::ChannelKind;
using vigil::pipeline::BatchPolicy;
using vigil::pipeline::Batcher;
using vigil::pipeline::DrainWorker;
using vigil::pipeline::EventBatch;
using vigil::ring::RingChannel;

struct Collector {
  std::mutex                       mutex;
  std::vector<vigil::model::Event> events;

  vigil::pipeline::BatchSink Sink() {
    return [this](EventBatch&& batch) {
      std::lock_guard lock(mutex);
      for (auto& event : batch.events) {
        events.push_back(std::move(event));
      }
    };
  }

  std::size_t Count() {
    std::lock_guard lock(mutex);
    return events.size();
  }
};

vigil::model::Event ProcessEvent(std::uint32_t pid) {
  vigil::model::Event event;
  event.timestamp = vigil::util::FromUnixMicros(1'000'000 + pid);
  event.sensor_id = "proc";
  event.pid       = pid;
  event.payload   = vigil::model::ProcessEvent{vigil::model::ProcessOperation::kCreate, 1, "init"};
  return event;
}

void TestDecodedEventsReachTheBatcher() {
  auto      channel = RingChannel::CreateAnonymous(ChannelKind::kProcess, 4096);
  Collector collector;
  Batcher   batcher(BatchPolicy{1, 1000ms}, collector.Sink());
  DrainWorker worker(*channel, batcher);

  auto producer = channel->Producer();
  for (std::uint32_t pid = 1; pid <= 10; ++pid) {
    assert(producer.TryWrite(vigil::codec::EncodeEvent(ProcessEvent(pid))));
  }

  assert(worker.DrainOnce(4) == 4);
  assert(worker.DrainOnce(100) == 6);
  assert(worker.DrainOnce(100) == 0);

  assert(worker.EventsForwarded() == 10);
  assert(collector.Count() == 10);
  for (std::uint32_t i = 0; i < 10; ++i) {
    assert(collector.events[i] == ProcessEvent(i + 1));
  }
}

void TestUndecodableFrameResynchronizesTheChannel() {
  auto      channel = RingChannel::CreateAnonymous(ChannelKind::kProcess, 4096);
  Collector collector;
  Batcher   batcher(BatchPolicy{1, 1000ms}, collector.Sink());
  DrainWorker worker(*channel, batcher);

  auto producer = channel->Producer();
  assert(producer.TryWrite(std::vector<std::uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
  assert(producer.TryWrite(vigil::codec::EncodeEvent(ProcessEvent(1))));

  worker.DrainOnce(100);
  assert(worker.DecodeErrors() == 1);
  assert(worker.EventsForwarded() == 0);
  assert(channel->Consumer().Desyncs() == 1);
  assert(channel->Dropped() >= 1);

  // later frames decode normally
  assert(producer.TryWrite(vigil::codec::EncodeEvent(ProcessEvent(2))));
  assert(worker.DrainOnce(100) == 1);
  assert(worker.EventsForwarded() == 1);
  assert(collector.Count() == 1);
  assert(collector.events[0].pid == 2);
}

void TestFrameOfAnotherKindIsADecodeError() {
  auto      channel = RingChannel::CreateAnonymous(ChannelKind::kNetwork, 4096);
  Collector collector;
  Batcher   batcher(BatchPolicy{1, 1000ms}, collector.Sink());
  DrainWorker worker(*channel, batcher);

  assert(channel->Producer().TryWrite(vigil::codec::EncodeEvent(ProcessEvent(1))));
  worker.DrainOnce(100);
  assert(worker.DecodeErrors() == 1);
  assert(collector.Count() == 0);
}

void TestStopDrainsWhatWasPublished() {
  auto      channel = RingChannel::CreateAnonymous(ChannelKind::kProcess, 1 << 16);
  Collector collector;
  Batcher   batcher(BatchPolicy{50, 1h}, collector.Sink());

  vigil::pipeline::DrainOptions options;
  options.max_backoff = 1000us;
  DrainWorker worker(*channel, batcher, options);
  worker.Start();

  auto producer = channel->Producer();
  for (std::uint32_t pid = 1; pid <= 200; ++pid) {
    assert(producer.TryWrite(vigil::codec::EncodeEvent(ProcessEvent(pid))));
  }

  worker.Stop();
  batcher.FlushAll();

  assert(channel->UsedBytes() == 0);
  assert(worker.EventsForwarded() == 200);
  assert(collector.Count() == 200);
  for (std::uint32_t i = 0; i < 200; ++i) {
    assert(collector.events[i].pid == i + 1);
  }
}

void TestCorruptHeadIsChargedOnce() {
  auto        channel = RingChannel::CreateAnonymous(ChannelKind::kProcess, 256);
  Collector   collector;
  Batcher     batcher(BatchPolicy{1, 1000ms}, collector.Sink());
  DrainWorker worker(*channel, batcher);

  auto producer = channel->Producer();
  for (std::uint32_t pid = 1; pid <= 3; ++pid) {
    assert(producer.TryWrite(vigil::codec::EncodeEvent(ProcessEvent(pid))));
  }
  assert(worker.DrainOnce(100) == 3);

  channel->Header()->head.store(1000);
  for (int pass = 0; pass < 5; ++pass) {
    assert(worker.DrainOnce(1024) == 0);
  }

  // one estimate for the whole ring, not one per pass
  const auto dropped = channel->Dropped();
  assert(dropped >= 1);
  assert(dropped < 256);
  assert(channel->Consumer().Desyncs() == 1);
  assert(worker.EventsForwarded() == 3);
}

} // namespace

int main() {
  TestDecodedEventsReachTheBatcher();
  TestUndecodableFrameResynchronizesTheChannel();
  TestFrameOfAnotherKindIsADecodeError();
  TestStopDrainsWhatWasPublished();
  TestCorruptHeadIsChargedOnce();

  std::cout << "vigil_unit_drain_worker: pass\n";
  return 0;
}
