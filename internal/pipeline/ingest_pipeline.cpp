#include "ingest_pipeline.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace vigil::pipeline {

IngestPipeline::IngestPipeline(std::vector<std::unique_ptr<ring::RingChannel>> channels, BatchPolicy policy, DrainOptions drain,
                               BatchSink sink)
    : channels_(std::move(channels)), batcher_(policy, std::move(sink)) {
  workers_.reserve(channels_.size());
  for (auto& channel : channels_) {
    workers_.push_back(std::make_unique<DrainWorker>(*channel, batcher_, drain));
  }
}

IngestPipeline::~IngestPipeline() {
  Stop();
}

void IngestPipeline::Start() {
  if (started_) {
    return;
  }
  batcher_.Start();
  for (auto& worker : workers_) {
    worker->Start();
  }
  started_ = true;
  VIGIL_LOG_INFO("ingest pipeline started", {observability::UintField("channels", channels_.size())});
}

void IngestPipeline::Stop() {
  if (!started_) {
    return;
  }
  for (auto& worker : workers_) {
    worker->Stop();
  }
  batcher_.Stop();
  started_ = false;
  VIGIL_LOG_INFO("ingest pipeline stopped");
}

std::vector<ChannelStats> IngestPipeline::Stats() const {
  std::vector<ChannelStats> stats;
  stats.reserve(workers_.size());
  for (const auto& worker : workers_) {
    const auto&  channel = worker->Channel();
    ChannelStats s;
    s.kind          = channel.Kind();
    s.name          = channel.Name();
    s.size_bytes    = channel.Size();
    s.used_bytes    = channel.UsedBytes();
    s.dropped       = channel.Dropped();
    s.frames        = channel.Consumer().FramesRead();
    s.desyncs       = channel.Consumer().Desyncs();
    s.decode_errors = worker->DecodeErrors();
    stats.push_back(std::move(s));
  }
  return stats;
}

std::size_t IngestPipeline::PendingEvents() const {
  return batcher_.PendingEvents();
}

ring::RingChannel* IngestPipeline::Channel(model::ChannelKind kind) const {
  for (const auto& channel : channels_) {
    if (channel->Kind() == kind) {
      return channel.get();
    }
  }
  return nullptr;
}

} // namespace vigil::pipeline
