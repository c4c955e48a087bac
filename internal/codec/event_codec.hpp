#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/model/channel_kind.hpp"
#include "internal/model/event.hpp"

namespace vigil::codec {

inline constexpr std::uint8_t kFrameVersion = 1;

/*
  Frame payload layout, all integers little-endian:

    u8  kind tag (ChannelKind)
    u8  layout version
    i64 timestamp, microseconds since the Unix epoch
    u32 pid
    str16 sensor_id
    str16 exe_path
    ... kind-specific fields

  filesystem: u8 op, str16 path, u8 has_new_path, [str16 new_path],
              u64 size, bytes16 content_hash, u8 result
  network:    u8 direction, u8 protocol, addr src, u16 src_port,
              addr dst, u16 dst_port, u64 bytes, u8 verdict, str16 rule_id
              (addr = u8 version (4|6) + 16 address bytes)
  etw:        16 bytes provider guid, u16 event_id, u8 level,
              u32 thread_id, str32 payload
  process:    u8 op, u32 parent_pid, str32 command_line

  The ring's own 4-byte length prefix is not part of this layout.
*/
std::vector<std::uint8_t> EncodeEvent(const model::Event& event);

// Throws util::DecodeError on any violation, including a kind tag that
// differs from the channel the frame was read from and trailing bytes.
model::Event DecodeEvent(model::ChannelKind expected, const std::uint8_t* data, std::size_t size);

inline model::Event DecodeEvent(model::ChannelKind expected, const std::vector<std::uint8_t>& frame) {
  return DecodeEvent(expected, frame.data(), frame.size());
}

} // namespace vigil::codec
