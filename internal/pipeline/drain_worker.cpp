#include "drain_worker.hpp"

#include <algorithm>
#include <string>

#include "internal/codec/event_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vigil::pipeline {

using observability::StringField;
using observability::UintField;

DrainWorker::DrainWorker(ring::RingChannel& channel, Batcher& batcher, DrainOptions options)
    : channel_(channel), batcher_(batcher), options_(options) {
}

DrainWorker::~DrainWorker() {
  Stop();
}

void DrainWorker::Start() {
  running_ = true;
  thread_  = std::thread(&DrainWorker::Loop, this);
}

void DrainWorker::Stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::size_t DrainWorker::DrainOnce(std::size_t max_frames) {
  auto&       consumer = channel_.Consumer();
  std::size_t consumed = 0;

  while (consumed < max_frames) {
    const auto status = consumer.TryRead(frame_);
    if (status == ring::ReadStatus::kEmpty || status == ring::ReadStatus::kStalled) {
      break;
    }
    if (status == ring::ReadStatus::kHeadInvalid) {
      HandleCorruption("head offset outside the ring");
      break;
    }
    ++consumed;

    if (status == ring::ReadStatus::kDesync) {
      HandleCorruption("frame length exceeds published bytes");
      continue;
    }

    model::Event event;
    try {
      event = codec::DecodeEvent(channel_.Kind(), frame_);
    } catch (const util::DecodeError& e) {
      decode_errors_.fetch_add(1, std::memory_order_relaxed);
      observability::Metrics::Instance().RecordDecodeError(model::ToString(channel_.Kind()));
      HandleCorruption(e.what());
      continue;
    }

    batcher_.Append(std::move(event));
    events_.fetch_add(1, std::memory_order_relaxed);
  }

  if (consumed > 0) {
    observability::Metrics::Instance().SetChannelDropped(model::ToString(channel_.Kind()), channel_.Dropped());
  }
  return consumed;
}

void DrainWorker::HandleCorruption(const char* reason) {
  const auto lost = channel_.Consumer().Resync();
  VIGIL_LOG_WARN("ring channel desynchronized, skipping to head",
                 {StringField("channel", model::ToString(channel_.Kind())), StringField("reason", reason),
                  UintField("estimated_lost", lost), UintField("dropped", channel_.Dropped())});
}

void DrainWorker::Loop() {
  VIGIL_LOG_INFO("drain worker started", {StringField("channel", model::ToString(channel_.Kind())), StringField("name", channel_.Name())});

  auto backoff = options_.min_backoff;
  while (running_) {
    if (DrainOnce(options_.frames_per_pass) > 0) {
      backoff = options_.min_backoff;
      continue;
    }
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, options_.max_backoff);
  }

  // Bounded drain window: whatever the producer published before shutdown.
  const auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
  std::size_t drained = 0;
  while (std::chrono::steady_clock::now() < deadline) {
    const auto n = DrainOnce(options_.frames_per_pass);
    if (n == 0) {
      break;
    }
    drained += n;
  }

  VIGIL_LOG_INFO("drain worker stopped", {StringField("channel", model::ToString(channel_.Kind())), UintField("drained_on_stop", drained),
                                          UintField("pending_bytes", channel_.UsedBytes())});
}

} // namespace vigil::pipeline
