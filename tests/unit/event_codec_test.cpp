#include "internal/codec/event_codec.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using namespace vigil;
using model::ChannelKind;

model::Event Envelope(model::EventPayload payload) {
  model::Event event;
  // frames carry microseconds
  event.timestamp = util::FromUnixMicros(1'700'000'000'123'456);
  event.sensor_id = "fs-minifilter";
  event.pid       = 4242;
  event.exe_path  = "C:\\Windows\\System32\\notepad.exe";
  event.payload   = std::move(payload);
  return event;
}

// Offset of the first kind-specific byte for events built by Envelope().
std::size_t PayloadOffset(const model::Event& event) {
  return 1 + 1 + 8 + 4 + 2 + event.sensor_id.size() + 2 + event.exe_path.size();
}

template <typename Fn>
bool ThrowsDecodeError(Fn&& fn) {
  try {
    fn();
  } catch (const util::DecodeError&) {
    return true;
  }
  return false;
}

void TestEveryKindDecodesToTheEncodedEvent() {
  model::FileEvent rename;
  rename.operation    = model::FileOperation::kRename;
  rename.path         = "C:\\data\\a.txt";
  rename.new_path     = "C:\\data\\b.txt";
  rename.size         = 77;
  rename.content_hash = std::vector<std::uint8_t>(32, 0x5A);
  rename.result       = model::FileResult::kBlocked;

  model::NetworkEvent net;
  net.direction        = model::Direction::kInbound;
  net.protocol         = 17;
  net.source           = *model::IpAddress::Parse("fe80::1");
  net.source_port      = 5353;
  net.destination      = *model::IpAddress::Parse("192.168.1.20");
  net.destination_port = 53;
  net.byte_count       = 1ull << 40;
  net.verdict          = model::Verdict::kAudit;
  net.rule_id          = "dns-watch";

  model::EtwEvent etw;
  etw.provider_id = *model::ParseGuid("{22FB2CD6-0E7B-422B-A0C7-2FAD1FD0E716}");
  etw.event_id    = 4688;
  etw.level       = 5;
  etw.thread_id   = 99;
  etw.payload     = std::string(70000, 'x');

  model::ProcessEvent process;
  process.operation    = model::ProcessOperation::kTerminate;
  process.parent_pid   = 1;
  process.command_line = "cmd.exe /c exit 3";

  const std::vector<model::Event> events = {Envelope(rename), Envelope(net), Envelope(etw), Envelope(process)};
  for (const auto& event : events) {
    const auto frame   = codec::EncodeEvent(event);
    const auto decoded = codec::DecodeEvent(model::KindOf(event), frame);
    assert(decoded == event);
  }
}

void TestFileEventWithoutNewPathStaysEmpty() {
  model::FileEvent create;
  create.path = "/tmp/x";
  const auto event   = Envelope(create);
  const auto decoded = codec::DecodeEvent(ChannelKind::kFilesystem, codec::EncodeEvent(event));
  assert(!std::get<model::FileEvent>(decoded.payload).new_path.has_value());
  assert(decoded == event);
}

void TestFrameOnTheWrongChannelIsRejected() {
  const auto frame = codec::EncodeEvent(Envelope(model::ProcessEvent{}));
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kNetwork, frame); }));
}

void TestUnknownVersionIsRejected() {
  auto frame = codec::EncodeEvent(Envelope(model::ProcessEvent{}));
  frame[1]   = 2;
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kProcess, frame); }));
}

void TestTruncatedFrameIsRejected() {
  const auto frame = codec::EncodeEvent(Envelope(model::FileEvent{}));
  for (std::size_t len = 0; len < frame.size(); len += 3) {
    assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kFilesystem, frame.data(), len); }));
  }
}

void TestTrailingBytesAreRejected() {
  auto frame = codec::EncodeEvent(Envelope(model::EtwEvent{.level = 1}));
  frame.push_back(0);
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kEtw, frame); }));
}

void TestOutOfRangeEnumsAreRejected() {
  const auto file_event = Envelope(model::FileEvent{});
  auto       frame      = codec::EncodeEvent(file_event);
  frame[PayloadOffset(file_event)] = 9;
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kFilesystem, frame); }));

  const auto process_event = Envelope(model::ProcessEvent{});
  frame                    = codec::EncodeEvent(process_event);
  frame[PayloadOffset(process_event)] = 0;
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kProcess, frame); }));

  // levels above 5 are not defined
  const auto etw_event = Envelope(model::EtwEvent{.level = 4});
  frame                = codec::EncodeEvent(etw_event);
  frame[PayloadOffset(etw_event) + 16 + 2] = 6;
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kEtw, frame); }));
}

void TestUnknownAddressFamilyIsRejected() {
  const auto event = Envelope(model::NetworkEvent{});
  auto       frame = codec::EncodeEvent(event);
  // direction, protocol, then the source address version byte
  frame[PayloadOffset(event) + 2] = 5;
  assert(ThrowsDecodeError([&] { codec::DecodeEvent(ChannelKind::kNetwork, frame); }));
}

void TestOverlongShortStringIsRefusedOnEncode() {
  model::FileEvent file;
  file.path = std::string(70000, 'p');

  bool threw = false;
  try {
    codec::EncodeEvent(Envelope(file));
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEveryKindDecodesToTheEncodedEvent();
  TestFileEventWithoutNewPathStaysEmpty();
  TestFrameOnTheWrongChannelIsRejected();
  TestUnknownVersionIsRejected();
  TestTruncatedFrameIsRejected();
  TestTrailingBytesAreRejected();
  TestOutOfRangeEnumsAreRejected();
  TestUnknownAddressFamilyIsRejected();
  TestOverlongShortStringIsRefusedOnEncode();

  std::cout << "vigil_unit_event_codec: pass\n";
  return 0;
}
