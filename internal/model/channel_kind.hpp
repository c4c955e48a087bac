#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vigil::model {

/*
  One ring channel, one frame layout and one event table per kind.
  The numeric value is the kind tag carried in every frame.
*/
enum class ChannelKind : std::uint8_t {
  kFilesystem = 1,
  kNetwork    = 2,
  kEtw        = 3,
  kProcess    = 4,
};

inline constexpr std::size_t kChannelKindCount = 4;

inline constexpr std::array<ChannelKind, kChannelKindCount> kAllChannelKinds = {
    ChannelKind::kFilesystem, ChannelKind::kNetwork, ChannelKind::kEtw, ChannelKind::kProcess};

constexpr std::size_t IndexOf(ChannelKind kind) {
  return static_cast<std::size_t>(kind) - 1;
}

constexpr std::string_view ToString(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::kFilesystem:
      return "filesystem";
    case ChannelKind::kNetwork:
      return "network";
    case ChannelKind::kEtw:
      return "etw";
    case ChannelKind::kProcess:
      return "process";
  }
  return "unknown";
}

// Destination table of the events carried by a channel.
constexpr std::string_view TableName(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::kFilesystem:
      return "fs_events";
    case ChannelKind::kNetwork:
      return "network_events";
    case ChannelKind::kEtw:
      return "etw_events";
    case ChannelKind::kProcess:
      return "process_events";
  }
  return "";
}

constexpr std::optional<ChannelKind> ParseChannelKind(std::string_view name) {
  for (auto kind : kAllChannelKinds) {
    if (ToString(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

constexpr std::optional<ChannelKind> ChannelKindFromTag(std::uint8_t tag) {
  if (tag < 1 || tag > kChannelKindCount) {
    return std::nullopt;
  }
  return static_cast<ChannelKind>(tag);
}

} // namespace vigil::model
