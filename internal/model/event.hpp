#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/channel_kind.hpp"
#include "internal/util/time.hpp"

namespace vigil::model {

using Guid = std::array<std::uint8_t, 16>;

enum class FileOperation : std::uint8_t {
  kCreate = 1,
  kWrite  = 2,
  kDelete = 3,
  kRename = 4,
};

enum class FileResult : std::uint8_t {
  kSuccess = 1,
  kFailure = 2,
  kBlocked = 3,
};

enum class Direction : std::uint8_t {
  kInbound  = 1,
  kOutbound = 2,
};

enum class Verdict : std::uint8_t {
  kAllow = 1,
  kBlock = 2,
  kAudit = 3,
};

enum class ProcessOperation : std::uint8_t {
  kCreate    = 1,
  kTerminate = 2,
};

/*
  IPv4 or IPv6 address in network byte order. IPv4 uses the first
  four bytes.
*/
struct IpAddress {
  std::uint8_t                  version = 4;
  std::array<std::uint8_t, 16> bytes{};

  static std::optional<IpAddress> Parse(std::string_view text);
  std::string                     ToString() const;

  bool operator==(const IpAddress&) const = default;
};

struct FileEvent {
  FileOperation              operation = FileOperation::kCreate;
  std::string                path;
  std::optional<std::string> new_path;
  std::uint64_t              size = 0;
  std::vector<std::uint8_t>  content_hash;
  FileResult                 result = FileResult::kSuccess;

  bool operator==(const FileEvent&) const = default;
};

struct NetworkEvent {
  Direction     direction = Direction::kOutbound;
  // IANA protocol number (6 = tcp, 17 = udp)
  std::uint8_t  protocol = 6;
  IpAddress     source;
  std::uint16_t source_port = 0;
  IpAddress     destination;
  std::uint16_t destination_port = 0;
  std::uint64_t byte_count       = 0;
  Verdict       verdict          = Verdict::kAllow;
  std::string   rule_id;

  bool operator==(const NetworkEvent&) const = default;
};

struct EtwEvent {
  Guid          provider_id{};
  std::uint16_t event_id  = 0;
  std::uint8_t  level     = 0;
  std::uint32_t thread_id = 0;
  // structured payload, JSON text as emitted by the session
  std::string   payload;

  bool operator==(const EtwEvent&) const = default;
};

struct ProcessEvent {
  ProcessOperation operation  = ProcessOperation::kCreate;
  std::uint32_t    parent_pid = 0;
  std::string      command_line;

  bool operator==(const ProcessEvent&) const = default;
};

// Alternative order follows the ChannelKind tag values.
using EventPayload = std::variant<FileEvent, NetworkEvent, EtwEvent, ProcessEvent>;

/*
  Decoded event: the envelope shared by every kind plus the kind-specific
  payload. The payload alternative determines channel and table.
*/
struct Event {
  util::TimePoint timestamp{};
  std::string     sensor_id;
  std::uint32_t   pid = 0;
  std::string     exe_path;
  EventPayload    payload;

  bool operator==(const Event&) const = default;
};

ChannelKind KindOf(const Event& event);
ChannelKind KindOf(const EventPayload& payload);

std::string_view ToString(FileOperation op);
std::string_view ToString(FileResult result);
std::string_view ToString(Direction direction);
std::string_view ToString(Verdict verdict);
std::string_view ToString(ProcessOperation op);
std::string      ProtocolName(std::uint8_t protocol);

std::string          GuidToString(const Guid& guid);
std::optional<Guid>  ParseGuid(std::string_view text);
std::string          HexEncode(const std::vector<std::uint8_t>& bytes);

} // namespace vigil::model
