#include "ring_consumer.hpp"

#include <algorithm>

namespace vigil::ring {

RingConsumer::RingConsumer(RingHeader* header, std::uint8_t* data) : header_(header), data_(data) {
}

ReadStatus RingConsumer::TryRead(std::vector<std::uint8_t>& payload) {
  const std::uint32_t size = header_->size;
  const std::uint32_t tail = header_->tail.load(std::memory_order_relaxed);
  const std::uint32_t head = header_->head.load(std::memory_order_acquire);

  if (head >= size) {
    return head_charged_ && charged_head_ == head ? ReadStatus::kStalled : ReadStatus::kHeadInvalid;
  }
  head_charged_ = false;

  if (head == tail) {
    return ReadStatus::kEmpty;
  }
  if (tail >= size) {
    return ReadStatus::kDesync;
  }

  const std::uint32_t available = UsedBytes(head, tail, size);
  if (available < kFrameLengthBytes) {
    return ReadStatus::kDesync;
  }

  std::uint8_t prefix[kFrameLengthBytes];
  CopyOut(data_, size, tail, prefix, kFrameLengthBytes);
  const std::uint32_t length = DecodeLength(prefix);
  if (length > available - kFrameLengthBytes) {
    return ReadStatus::kDesync;
  }

  const std::uint32_t body = Advance(tail, kFrameLengthBytes, size);
  payload.resize(length);
  if (length > 0) {
    CopyOut(data_, size, body, payload.data(), length);
  }

  const std::uint32_t consumed = kFrameLengthBytes + length;
  ZeroRange(data_, size, tail, consumed);
  header_->tail.store(Advance(tail, consumed, size), std::memory_order_release);

  frames_.fetch_add(1, std::memory_order_relaxed);
  frame_bytes_ += consumed;
  return ReadStatus::kFrame;
}

std::uint32_t RingConsumer::Resync() {
  const std::uint32_t size = header_->size;
  const std::uint32_t tail = header_->tail.load(std::memory_order_relaxed);
  const std::uint32_t head = header_->head.load(std::memory_order_acquire);

  desyncs_.fetch_add(1, std::memory_order_relaxed);

  // A corrupted head cannot be repaired from this side; restart at zero and
  // let the producer's bounds check refuse writes until it recovers.
  if (head >= size) {
    head_charged_ = true;
    charged_head_ = head;
  }
  const std::uint32_t target  = head < size ? head : 0;
  const std::uint32_t skipped = tail < size && head < size ? UsedBytes(head, tail, size) : size - 1;

  if (tail < size && head < size) {
    ZeroRange(data_, size, tail, skipped);
  }
  header_->tail.store(target, std::memory_order_release);

  const std::uint32_t lost = EstimateLostFrames(skipped);
  header_->dropped.fetch_add(lost, std::memory_order_relaxed);
  return lost;
}

std::uint32_t RingConsumer::EstimateLostFrames(std::uint32_t bytes) const {
  const std::uint64_t frames = frames_.load(std::memory_order_relaxed);
  if (frames == 0 || frame_bytes_ == 0) {
    return 1;
  }
  const std::uint64_t average = std::max<std::uint64_t>(1, frame_bytes_ / frames);
  const std::uint64_t lost    = (static_cast<std::uint64_t>(bytes) + average - 1) / average;
  return static_cast<std::uint32_t>(std::clamp<std::uint64_t>(lost, 1, bytes == 0 ? 1 : bytes));
}

} // namespace vigil::ring
