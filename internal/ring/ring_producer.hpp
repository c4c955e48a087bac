#pragma once

#include <cstdint>
#include <vector>

#include "ring_layout.hpp"

namespace vigil::ring {

/*
  Writing end of a ring channel.

  Never blocks, never allocates and never overwrites unconsumed bytes: a
  frame that does not fit is refused and counted in the header's dropped
  field. Safe to call from a context that must not fail.
*/
class RingProducer {
 public:
  RingProducer(RingHeader* header, std::uint8_t* data) noexcept;

  bool TryWrite(const std::uint8_t* payload, std::uint32_t length) noexcept;

  bool TryWrite(const std::vector<std::uint8_t>& payload) noexcept {
    return TryWrite(payload.data(), static_cast<std::uint32_t>(payload.size()));
  }

 private:
  RingHeader*   header_;
  std::uint8_t* data_;
};

} // namespace vigil::ring
