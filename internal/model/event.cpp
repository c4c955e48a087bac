#include "event.hpp"

#include <arpa/inet.h>

#include <type_traits>

namespace vigil::model {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

constexpr char kHex[] = "0123456789abcdef";

} // namespace

std::optional<IpAddress> IpAddress::Parse(std::string_view text) {
  const std::string value(text);
  IpAddress         address;

  if (inet_pton(AF_INET, value.c_str(), address.bytes.data()) == 1) {
    address.version = 4;
    return address;
  }
  if (inet_pton(AF_INET6, value.c_str(), address.bytes.data()) == 1) {
    address.version = 6;
    return address;
  }
  return std::nullopt;
}

std::string IpAddress::ToString() const {
  char buffer[INET6_ADDRSTRLEN] = {};
  const int family = version == 6 ? AF_INET6 : AF_INET;
  if (inet_ntop(family, bytes.data(), buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  return buffer;
}

ChannelKind KindOf(const EventPayload& payload) {
  return std::visit(
      [](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, FileEvent>) {
          return ChannelKind::kFilesystem;
        } else if constexpr (std::is_same_v<T, NetworkEvent>) {
          return ChannelKind::kNetwork;
        } else if constexpr (std::is_same_v<T, EtwEvent>) {
          return ChannelKind::kEtw;
        } else {
          return ChannelKind::kProcess;
        }
      },
      payload);
}

ChannelKind KindOf(const Event& event) {
  return KindOf(event.payload);
}

std::string_view ToString(FileOperation op) {
  switch (op) {
    case FileOperation::kCreate:
      return "create";
    case FileOperation::kWrite:
      return "write";
    case FileOperation::kDelete:
      return "delete";
    case FileOperation::kRename:
      return "rename";
  }
  return "unknown";
}

std::string_view ToString(FileResult result) {
  switch (result) {
    case FileResult::kSuccess:
      return "success";
    case FileResult::kFailure:
      return "failure";
    case FileResult::kBlocked:
      return "blocked";
  }
  return "unknown";
}

std::string_view ToString(Direction direction) {
  return direction == Direction::kInbound ? "inbound" : "outbound";
}

std::string_view ToString(Verdict verdict) {
  switch (verdict) {
    case Verdict::kAllow:
      return "allow";
    case Verdict::kBlock:
      return "block";
    case Verdict::kAudit:
      return "audit";
  }
  return "unknown";
}

std::string_view ToString(ProcessOperation op) {
  return op == ProcessOperation::kCreate ? "create" : "terminate";
}

std::string ProtocolName(std::uint8_t protocol) {
  switch (protocol) {
    case 1:
      return "icmp";
    case 6:
      return "tcp";
    case 17:
      return "udp";
    case 58:
      return "icmpv6";
    default:
      return std::to_string(protocol);
  }
}

std::string GuidToString(const Guid& guid) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < guid.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[guid[i] >> 4]);
    out.push_back(kHex[guid[i] & 0x0F]);
  }
  return out;
}

std::optional<Guid> ParseGuid(std::string_view text) {
  if (text.size() == 38 && text.front() == '{' && text.back() == '}') {
    text = text.substr(1, 36);
  }
  if (text.size() != 36) {
    return std::nullopt;
  }

  Guid        guid{};
  std::size_t byte = 0;
  for (std::size_t i = 0; i < text.size();) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') return std::nullopt;
      ++i;
      continue;
    }
    const int hi = HexNibble(text[i]);
    const int lo = HexNibble(text[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    guid[byte++] = static_cast<std::uint8_t>((hi << 4) | lo);
    i += 2;
  }
  return guid;
}

std::string HexEncode(const std::vector<std::uint8_t>& bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace vigil::model
