#include "event_codec.hpp"

#include <string>
#include <type_traits>

#include "wire.hpp"

namespace vigil::codec {

namespace {

constexpr std::uint8_t kMaxEtwLevel = 5;

template <typename E>
E CheckedEnum(std::uint8_t raw, std::uint8_t max, const char* field) {
  if (raw < 1 || raw > max) {
    throw util::DecodeError(std::string("unknown ") + field + " value " + std::to_string(raw));
  }
  return static_cast<E>(raw);
}

void PutAddress(WireWriter& w, const model::IpAddress& addr) {
  w.U8(addr.version);
  w.Raw(addr.bytes.data(), addr.bytes.size());
}

model::IpAddress GetAddress(WireReader& r, const char* field) {
  model::IpAddress addr;
  addr.version = r.U8(field);
  if (addr.version != 4 && addr.version != 6) {
    throw util::DecodeError(std::string("unknown address family in ") + field);
  }
  r.Raw(addr.bytes.data(), addr.bytes.size(), field);
  return addr;
}

void EncodePayload(WireWriter& w, const model::FileEvent& e) {
  w.U8(static_cast<std::uint8_t>(e.operation));
  w.Str16(e.path, "path");
  w.U8(e.new_path ? 1 : 0);
  if (e.new_path) {
    w.Str16(*e.new_path, "new_path");
  }
  w.U64(e.size);
  w.Bytes16(e.content_hash, "content_hash");
  w.U8(static_cast<std::uint8_t>(e.result));
}

void EncodePayload(WireWriter& w, const model::NetworkEvent& e) {
  w.U8(static_cast<std::uint8_t>(e.direction));
  w.U8(e.protocol);
  PutAddress(w, e.source);
  w.U16(e.source_port);
  PutAddress(w, e.destination);
  w.U16(e.destination_port);
  w.U64(e.byte_count);
  w.U8(static_cast<std::uint8_t>(e.verdict));
  w.Str16(e.rule_id, "rule_id");
}

void EncodePayload(WireWriter& w, const model::EtwEvent& e) {
  w.Raw(e.provider_id.data(), e.provider_id.size());
  w.U16(e.event_id);
  w.U8(e.level);
  w.U32(e.thread_id);
  w.Str32(e.payload);
}

void EncodePayload(WireWriter& w, const model::ProcessEvent& e) {
  w.U8(static_cast<std::uint8_t>(e.operation));
  w.U32(e.parent_pid);
  w.Str32(e.command_line);
}

model::FileEvent DecodeFile(WireReader& r) {
  model::FileEvent e;
  e.operation = CheckedEnum<model::FileOperation>(r.U8("op"), 4, "file operation");
  e.path      = r.Str16("path");

  const std::uint8_t has_new_path = r.U8("has_new_path");
  if (has_new_path > 1) {
    throw util::DecodeError("invalid has_new_path flag");
  }
  if (has_new_path == 1) {
    e.new_path = r.Str16("new_path");
  }

  e.size         = r.U64("size");
  e.content_hash = r.Bytes16("content_hash");
  e.result       = CheckedEnum<model::FileResult>(r.U8("result"), 3, "file result");
  return e;
}

model::NetworkEvent DecodeNetwork(WireReader& r) {
  model::NetworkEvent e;
  e.direction        = CheckedEnum<model::Direction>(r.U8("direction"), 2, "direction");
  e.protocol         = r.U8("protocol");
  e.source           = GetAddress(r, "src_ip");
  e.source_port      = r.U16("src_port");
  e.destination      = GetAddress(r, "dst_ip");
  e.destination_port = r.U16("dst_port");
  e.byte_count       = r.U64("bytes");
  e.verdict          = CheckedEnum<model::Verdict>(r.U8("verdict"), 3, "verdict");
  e.rule_id          = r.Str16("rule_id");
  return e;
}

model::EtwEvent DecodeEtw(WireReader& r) {
  model::EtwEvent e;
  r.Raw(e.provider_id.data(), e.provider_id.size(), "provider_guid");
  e.event_id = r.U16("event_id");
  e.level    = r.U8("level");
  if (e.level > kMaxEtwLevel) {
    throw util::DecodeError("unknown etw level " + std::to_string(e.level));
  }
  e.thread_id = r.U32("thread_id");
  e.payload   = r.Str32("payload");
  return e;
}

model::ProcessEvent DecodeProcess(WireReader& r) {
  model::ProcessEvent e;
  e.operation    = CheckedEnum<model::ProcessOperation>(r.U8("op"), 2, "process operation");
  e.parent_pid   = r.U32("parent_pid");
  e.command_line = r.Str32("command_line");
  return e;
}

} // namespace

std::vector<std::uint8_t> EncodeEvent(const model::Event& event) {
  WireWriter w;
  w.U8(static_cast<std::uint8_t>(model::KindOf(event)));
  w.U8(kFrameVersion);
  w.I64(util::ToUnixMicros(event.timestamp));
  w.U32(event.pid);
  w.Str16(event.sensor_id, "sensor_id");
  w.Str16(event.exe_path, "exe_path");

  std::visit([&w](const auto& payload) { EncodePayload(w, payload); }, event.payload);
  return w.Take();
}

model::Event DecodeEvent(model::ChannelKind expected, const std::uint8_t* data, std::size_t size) {
  WireReader r(data, size);

  const std::uint8_t tag = r.U8("kind");
  if (tag != static_cast<std::uint8_t>(expected)) {
    throw util::DecodeError("frame kind " + std::to_string(tag) + " on " + std::string(model::ToString(expected)) + " channel");
  }

  const std::uint8_t version = r.U8("version");
  if (version != kFrameVersion) {
    throw util::DecodeError("unsupported frame version " + std::to_string(version));
  }

  model::Event event;
  event.timestamp = util::FromUnixMicros(r.I64("timestamp"));
  event.pid       = r.U32("pid");
  event.sensor_id = r.Str16("sensor_id");
  event.exe_path  = r.Str16("exe_path");

  switch (expected) {
    case model::ChannelKind::kFilesystem:
      event.payload = DecodeFile(r);
      break;
    case model::ChannelKind::kNetwork:
      event.payload = DecodeNetwork(r);
      break;
    case model::ChannelKind::kEtw:
      event.payload = DecodeEtw(r);
      break;
    case model::ChannelKind::kProcess:
      event.payload = DecodeProcess(r);
      break;
    default:
      throw util::DecodeError("no frame layout for channel kind " + std::to_string(tag));
  }

  r.ExpectEnd();
  return event;
}

} // namespace vigil::codec
