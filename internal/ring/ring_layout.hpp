#pragma once

#include <atomic>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace vigil::ring {

/*
  Shared-memory layout of one ring channel:

      [ head | tail | dropped | size ][ size bytes of circular data ]

  Each header field has exactly one plain writer:
    head     producer  (next free write offset)
    tail     consumer  (next unread offset)
    size     creator   (constant after creation)
  dropped is only ever changed with atomic read-modify-write, by the
  producer on refusal and by the consumer when it gives up a
  desynchronized region.

  Memory ordering: the producer copies the whole frame into the data area
  and only then stores head with release ordering; the consumer loads head
  with acquire ordering before touching frame bytes. The same pairing runs
  the other way for tail, so the producer never reuses bytes the consumer
  is still copying out.

  Only byte offsets cross the boundary, never pointers.
*/
struct RingHeader {
  std::atomic<std::uint32_t> head;
  std::atomic<std::uint32_t> tail;
  std::atomic<std::uint32_t> dropped;
  std::uint32_t              size;
};

static_assert(std::atomic<std::uint32_t>::is_always_lock_free, "ring header needs lock-free 32-bit atomics");
static_assert(sizeof(std::atomic<std::uint32_t>) == sizeof(std::uint32_t));
static_assert(sizeof(RingHeader) == 4 * sizeof(std::uint32_t));
static_assert(std::is_standard_layout_v<RingHeader>);

inline constexpr std::uint32_t kRingHeaderBytes  = sizeof(RingHeader);
inline constexpr std::uint32_t kFrameLengthBytes = 4;
inline constexpr std::uint32_t kMinRingSize      = 64;

// Bytes written but not yet consumed.
constexpr std::uint32_t UsedBytes(std::uint32_t head, std::uint32_t tail, std::uint32_t size) {
  return head >= tail ? head - tail : size - (tail - head);
}

// One byte stays reserved so that a full ring never reads as empty.
constexpr std::uint32_t FreeBytes(std::uint32_t head, std::uint32_t tail, std::uint32_t size) {
  return size - 1 - UsedBytes(head, tail, size);
}

constexpr std::uint32_t Advance(std::uint32_t offset, std::uint32_t n, std::uint32_t size) {
  const std::uint64_t next = static_cast<std::uint64_t>(offset) + n;
  return static_cast<std::uint32_t>(next % size);
}

// Wraparound-aware copies: the part past the end continues at offset 0.
inline void CopyIn(std::uint8_t* data, std::uint32_t size, std::uint32_t offset, const std::uint8_t* src, std::uint32_t n) noexcept {
  const std::uint32_t first = n < size - offset ? n : size - offset;
  std::memcpy(data + offset, src, first);
  if (n > first) {
    std::memcpy(data, src + first, n - first);
  }
}

inline void CopyOut(const std::uint8_t* data, std::uint32_t size, std::uint32_t offset, std::uint8_t* dst, std::uint32_t n) noexcept {
  const std::uint32_t first = n < size - offset ? n : size - offset;
  std::memcpy(dst, data + offset, first);
  if (n > first) {
    std::memcpy(dst + first, data, n - first);
  }
}

inline void ZeroRange(std::uint8_t* data, std::uint32_t size, std::uint32_t offset, std::uint32_t n) noexcept {
  const std::uint32_t first = n < size - offset ? n : size - offset;
  std::memset(data + offset, 0, first);
  if (n > first) {
    std::memset(data, 0, n - first);
  }
}

inline void EncodeLength(std::uint32_t length, std::uint8_t (&out)[kFrameLengthBytes]) noexcept {
  out[0] = static_cast<std::uint8_t>(length);
  out[1] = static_cast<std::uint8_t>(length >> 8);
  out[2] = static_cast<std::uint8_t>(length >> 16);
  out[3] = static_cast<std::uint8_t>(length >> 24);
}

inline std::uint32_t DecodeLength(const std::uint8_t (&in)[kFrameLengthBytes]) noexcept {
  return static_cast<std::uint32_t>(in[0]) | (static_cast<std::uint32_t>(in[1]) << 8) | (static_cast<std::uint32_t>(in[2]) << 16) |
         (static_cast<std::uint32_t>(in[3]) << 24);
}

} // namespace vigil::ring
