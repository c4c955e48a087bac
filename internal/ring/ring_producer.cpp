#include "ring_producer.hpp"

namespace vigil::ring {

RingProducer::RingProducer(RingHeader* header, std::uint8_t* data) noexcept : header_(header), data_(data) {
}

bool RingProducer::TryWrite(const std::uint8_t* payload, std::uint32_t length) noexcept {
  const std::uint32_t size = header_->size;
  const std::uint32_t head = header_->head.load(std::memory_order_relaxed);
  const std::uint32_t tail = header_->tail.load(std::memory_order_acquire);

  const std::uint64_t required = static_cast<std::uint64_t>(kFrameLengthBytes) + length;
  if (head >= size || tail >= size || required > FreeBytes(head, tail, size)) {
    header_->dropped.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  std::uint8_t prefix[kFrameLengthBytes];
  EncodeLength(length, prefix);

  CopyIn(data_, size, head, prefix, kFrameLengthBytes);
  const std::uint32_t body = Advance(head, kFrameLengthBytes, size);
  if (length > 0) {
    CopyIn(data_, size, body, payload, length);
  }

  header_->head.store(Advance(body, length, size), std::memory_order_release);
  return true;
}

} // namespace vigil::ring
