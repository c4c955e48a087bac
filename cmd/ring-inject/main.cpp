#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "internal/codec/event_codec.hpp"
#include "internal/model/channel_kind.hpp"
#include "internal/model/event.hpp"
#include "internal/ring/ring_channel.hpp"
#include "internal/util/time.hpp"

using namespace vigil;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ring-inject <prefix> <filesystem|network|etw|process> <count> [interval_us]\n"
            << "Maps the channel the agent created and writes synthetic events into it.\n";
}

static model::EventPayload SyntheticPayload(model::ChannelKind kind, std::uint64_t seq) {
  switch (kind) {
    case model::ChannelKind::kFilesystem: {
      model::FileEvent file;
      file.operation    = seq % 2 == 0 ? model::FileOperation::kCreate : model::FileOperation::kWrite;
      file.path         = "C:\\Users\\test\\Documents\\file" + std::to_string(seq) + ".txt";
      file.size         = 1024 + seq;
      file.content_hash = std::vector<std::uint8_t>(32, static_cast<std::uint8_t>(seq));
      return file;
    }
    case model::ChannelKind::kNetwork: {
      model::NetworkEvent net;
      net.direction        = model::Direction::kOutbound;
      net.protocol         = 6;
      net.source           = *model::IpAddress::Parse("10.0.0.5");
      net.source_port      = static_cast<std::uint16_t>(49152 + seq % 16000);
      net.destination      = *model::IpAddress::Parse("93.184.216.34");
      net.destination_port = 443;
      net.byte_count       = 512 * (seq + 1);
      net.rule_id          = "default-allow";
      return net;
    }
    case model::ChannelKind::kEtw: {
      model::EtwEvent etw;
      etw.provider_id = *model::ParseGuid("22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716");
      etw.event_id    = static_cast<std::uint16_t>(seq % 100);
      etw.level       = 4;
      etw.thread_id   = static_cast<std::uint32_t>(1000 + seq);
      etw.payload     = "{\"seq\":" + std::to_string(seq) + "}";
      return etw;
    }
    case model::ChannelKind::kProcess: {
      model::ProcessEvent process;
      process.operation    = seq % 2 == 0 ? model::ProcessOperation::kCreate : model::ProcessOperation::kTerminate;
      process.parent_pid   = 4;
      process.command_line = "notepad.exe file" + std::to_string(seq) + ".txt";
      return process;
    }
  }
  return model::ProcessEvent{};
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  const std::string prefix = argv[1];
  const auto        kind   = model::ParseChannelKind(argv[2]);
  if (!kind.has_value()) {
    std::cerr << "unknown channel kind: " << argv[2] << "\n";
    return 1;
  }

  std::uint64_t count = 0;
  std::uint64_t interval_us = 0;
  try {
    count = std::stoull(argv[3]);
    if (argc >= 5) {
      interval_us = std::stoull(argv[4]);
    }
  } catch (const std::exception& e) {
    std::cerr << "invalid number: " << e.what() << "\n";
    return 1;
  }

  try {
    auto channel  = ring::RingChannel::Open(*kind, ring::ChannelName(prefix, *kind));
    auto producer = channel->Producer();

    std::uint64_t written = 0;
    std::uint64_t refused = 0;
    for (std::uint64_t seq = 0; seq < count; ++seq) {
      model::Event event;
      event.timestamp = util::FromUnixMicros(util::ToUnixMicros(util::Now()));
      event.sensor_id = "ring-inject";
      event.pid       = static_cast<std::uint32_t>(::getpid());
      event.exe_path  = "/usr/bin/ring-inject";
      event.payload   = SyntheticPayload(*kind, seq);

      if (producer.TryWrite(codec::EncodeEvent(event))) {
        ++written;
      } else {
        ++refused;
      }
      if (interval_us > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(interval_us));
      }
    }

    std::cout << "channel=" << channel->Name() << " written=" << written << " refused=" << refused
              << " dropped_total=" << channel->Dropped() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "ring-inject failed: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
