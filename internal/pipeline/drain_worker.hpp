#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

#include "batcher.hpp"
#include "internal/ring/ring_channel.hpp"

namespace vigil::pipeline {

struct DrainOptions {
  std::chrono::microseconds min_backoff{100};
  std::chrono::microseconds max_backoff{10000};
  // how long Stop() keeps draining before giving up on the rest
  std::chrono::milliseconds drain_timeout{2000};
  std::size_t               frames_per_pass = 1024;
};

/*
  Sole consumer of one ring channel.

  Decodes frames and appends them to the batcher. Framing or decode
  failures resynchronize the channel and never stop the worker. An idle
  channel is polled with exponential backoff between min_backoff and
  max_backoff.
*/
class DrainWorker {
 public:
  DrainWorker(ring::RingChannel& channel, Batcher& batcher, DrainOptions options = {});
  ~DrainWorker();

  DrainWorker(const DrainWorker&)            = delete;
  DrainWorker& operator=(const DrainWorker&) = delete;

  void Start();
  void Stop();

  // One pass over at most max_frames frames. Returns frames consumed.
  std::size_t DrainOnce(std::size_t max_frames);

  std::uint64_t DecodeErrors() const {
    return decode_errors_.load(std::memory_order_relaxed);
  }

  std::uint64_t EventsForwarded() const {
    return events_.load(std::memory_order_relaxed);
  }

  const ring::RingChannel& Channel() const {
    return channel_;
  }

 private:
  void Loop();
  void HandleCorruption(const char* reason);

  ring::RingChannel& channel_;
  Batcher&           batcher_;
  DrainOptions       options_;

  std::vector<std::uint8_t> frame_;

  std::atomic<std::uint64_t> decode_errors_{0};
  std::atomic<std::uint64_t> events_{0};

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace vigil::pipeline
