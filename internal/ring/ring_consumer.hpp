#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "ring_layout.hpp"

namespace vigil::ring {

enum class ReadStatus {
  kEmpty,
  kFrame,
  kDesync,
  // head lies outside the ring; reported once per distinct value
  kHeadInvalid,
  // the invalid head was already charged; nothing can be read until the
  // producer side is reset
  kStalled,
};

/*
  Reading end of a ring channel. Exactly one thread may read.

  kDesync means the bytes at tail do not form a complete frame. The caller
  is expected to log and call Resync(), which skips everything currently
  published and charges an estimate of the lost frames to dropped.
  kHeadInvalid asks for the same handling, but only the first time a given
  out-of-range head is seen; afterwards TryRead returns kStalled.
*/
class RingConsumer {
 public:
  RingConsumer(RingHeader* header, std::uint8_t* data);

  ReadStatus TryRead(std::vector<std::uint8_t>& payload);

  // Returns the number of events charged to dropped.
  std::uint32_t Resync();

  std::uint64_t FramesRead() const {
    return frames_.load(std::memory_order_relaxed);
  }

  std::uint64_t Desyncs() const {
    return desyncs_.load(std::memory_order_relaxed);
  }

 private:
  std::uint32_t EstimateLostFrames(std::uint32_t bytes) const;

  RingHeader*   header_;
  std::uint8_t* data_;

  std::atomic<std::uint64_t> frames_{0};
  std::atomic<std::uint64_t> desyncs_{0};
  std::uint64_t              frame_bytes_ = 0;

  bool          head_charged_ = false;
  std::uint32_t charged_head_ = 0;
};

} // namespace vigil::ring
