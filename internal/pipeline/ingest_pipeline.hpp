#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "batcher.hpp"
#include "drain_worker.hpp"
#include "internal/ring/ring_channel.hpp"

namespace vigil::pipeline {

struct ChannelStats {
  model::ChannelKind kind = model::ChannelKind::kFilesystem;
  std::string        name;
  std::uint32_t      size_bytes    = 0;
  std::uint32_t      used_bytes    = 0;
  std::uint32_t      dropped       = 0;
  std::uint64_t      frames        = 0;
  std::uint64_t      desyncs       = 0;
  std::uint64_t      decode_errors = 0;
};

/*
  Ring channels, their drain workers and the shared batcher.

  Stop order: every worker gets its drain window, then the batcher hands
  all pending batches to the sink.
*/
class IngestPipeline {
 public:
  IngestPipeline(std::vector<std::unique_ptr<ring::RingChannel>> channels, BatchPolicy policy, DrainOptions drain, BatchSink sink);
  ~IngestPipeline();

  IngestPipeline(const IngestPipeline&)            = delete;
  IngestPipeline& operator=(const IngestPipeline&) = delete;

  void Start();
  void Stop();

  std::vector<ChannelStats> Stats() const;
  std::size_t               PendingEvents() const;

  // nullptr when no channel of this kind is configured
  ring::RingChannel* Channel(model::ChannelKind kind) const;

  Batcher& GetBatcher() {
    return batcher_;
  }

 private:
  std::vector<std::unique_ptr<ring::RingChannel>> channels_;
  Batcher                                         batcher_;
  std::vector<std::unique_ptr<DrainWorker>>       workers_;
  bool                                            started_ = false;
};

} // namespace vigil::pipeline
