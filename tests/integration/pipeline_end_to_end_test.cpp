#include <unistd.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/codec/event_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/factory.hpp"
#include "internal/ring/ring_channel.hpp"

namespace {

using vigil::model::ChannelKind;

std::string FreshDbPath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "vigil_pipeline_e2e_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / (test_name + "-" + std::to_string(::getpid()) + ".db")).string();
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }
  return path;
}

vigil::runtime::config::RuntimeConfig TestConfig(const std::string& db_path, const std::string& prefix) {
  vigil::runtime::config::RuntimeConfig config;
  config.mutable_database()->set_path(db_path);
  config.mutable_pipeline()->set_flush_interval_ms(20);
  config.mutable_pipeline()->set_batch_size(50);
  config.mutable_pipeline()->set_max_queued_events(10000);
  config.mutable_channels()->set_name_prefix(prefix + "-" + std::to_string(::getpid()));
  config.mutable_channels()->set_size_bytes(1u << 16);
  vigil::config::ConfigLoader::ApplyDefaults(config);
  vigil::config::ConfigLoader::Validate(config);
  return config;
}

vigil::model::Event FileEvent(std::uint32_t pid) {
  vigil::model::Event event;
  event.timestamp = vigil::util::FromUnixMicros(vigil::util::ToUnixMicros(vigil::util::Now()));
  event.sensor_id = "fs-minifilter";
  event.pid       = pid;
  event.exe_path  = "C:\\Windows\\explorer.exe";

  vigil::model::FileEvent file;
  file.operation = vigil::model::FileOperation::kWrite;
  file.path      = "C:\\Users\\Public\\report" + std::to_string(pid) + ".docx";
  file.size      = 4096;
  event.payload  = file;
  return event;
}

vigil::model::Event NetworkEvent(std::uint32_t pid) {
  vigil::model::Event event;
  event.timestamp = vigil::util::FromUnixMicros(vigil::util::ToUnixMicros(vigil::util::Now()));
  event.sensor_id = "wfp";
  event.pid       = pid;
  event.exe_path  = "C:\\Program Files\\browser.exe";

  vigil::model::NetworkEvent net;
  net.source           = *vigil::model::IpAddress::Parse("10.0.0.5");
  net.source_port      = 50000;
  net.destination      = *vigil::model::IpAddress::Parse("93.184.216.34");
  net.destination_port = 443;
  net.byte_count       = 1500;
  event.payload        = net;
  return event;
}

std::uint64_t CountRows(const std::string& path, ChannelKind kind) {
  vigil::db::sqlite::SqliteRepository repo(std::make_shared<vigil::db::sqlite::SqliteDB>(path));
  auto                                tx    = repo.BeginRead();
  const auto                          count = repo.CountEvents(*tx, kind);
  tx->Commit();
  assert(count.has_value());
  return *count;
}

void TestFramesFromProducersReachTheStore() {
  const auto path   = FreshDbPath("flow");
  const auto config = TestConfig(path, "vigil-e2e-flow");

  auto app = vigil::factory::Build(config);
  app.Start();

  // producers attach by name, the way a sensor process would
  auto fs  = vigil::ring::RingChannel::Open(ChannelKind::kFilesystem, vigil::ring::ChannelName(config.channels().name_prefix(), ChannelKind::kFilesystem));
  auto net = vigil::ring::RingChannel::Open(ChannelKind::kNetwork, vigil::ring::ChannelName(config.channels().name_prefix(), ChannelKind::kNetwork));

  std::uint32_t written_fs  = 0;
  std::uint32_t written_net = 0;
  for (std::uint32_t i = 0; i < 120; ++i) {
    while (!fs->Producer().TryWrite(vigil::codec::EncodeEvent(FileEvent(1000 + i)))) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ++written_fs;
    if (i % 2 == 0) {
      while (!net->Producer().TryWrite(vigil::codec::EncodeEvent(NetworkEvent(2000 + i)))) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
      ++written_net;
    }
  }

  // garbage payload: framed correctly but not a decodable event
  const std::vector<std::uint8_t> garbage = {0x01, 0x7F, 0x00};
  assert(fs->Producer().TryWrite(garbage));
  assert(fs->Producer().TryWrite(vigil::codec::EncodeEvent(FileEvent(9999))));
  ++written_fs;

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  app.Stop();

  assert(CountRows(path, ChannelKind::kFilesystem) == written_fs);
  assert(CountRows(path, ChannelKind::kNetwork) == written_net);
  assert(CountRows(path, ChannelKind::kEtw) == 0);

  std::uint64_t decode_errors = 0;
  for (const auto& s : app.pipeline->Stats()) {
    decode_errors += s.decode_errors;
    assert(s.used_bytes == 0);
  }
  assert(decode_errors == 1);

  const auto writer = app.writer->Stats();
  assert(writer.events_written == written_fs + written_net);
  assert(writer.dropped_events == 0);
  assert(writer.state == vigil::store::WriterState::kClosed);
}

void TestPurgeOnStartClearsEvents() {
  const auto path = FreshDbPath("purge");

  {
    auto config = TestConfig(path, "vigil-e2e-keep");
    auto app    = vigil::factory::Build(config);
    app.Start();
    auto fs = app.pipeline->Channel(ChannelKind::kFilesystem)->Producer();
    for (std::uint32_t i = 0; i < 10; ++i) {
      assert(fs.TryWrite(vigil::codec::EncodeEvent(FileEvent(i + 1))));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    app.Stop();
  }
  assert(CountRows(path, ChannelKind::kFilesystem) == 10);

  {
    auto config = TestConfig(path, "vigil-e2e-purge");
    config.mutable_database()->set_purge_on_start(true);
    auto app = vigil::factory::Build(config);
    assert(CountRows(path, ChannelKind::kFilesystem) == 0);

    // sensor configuration and its audit survive the purge
    const auto snapshot = app.config_store->Snapshot();
    assert(snapshot.etw().level() == 2);

    const auto history = app.config_store->ListAudit(std::nullopt, 100);
    assert(history.size() == 1);
    assert(history[0].actor() == "operator");
  }
}

void TestSubsetOfChannels() {
  const auto path   = FreshDbPath("subset");
  auto       config = TestConfig(path, "vigil-e2e-subset");
  config.mutable_channels()->clear_kinds();
  config.mutable_channels()->add_kinds("etw");

  auto app = vigil::factory::Build(config);
  assert(app.pipeline->Channel(ChannelKind::kEtw) != nullptr);
  assert(app.pipeline->Channel(ChannelKind::kFilesystem) == nullptr);
  assert(app.pipeline->Stats().size() == 1);
}

} // namespace

int main() {
  TestFramesFromProducersReachTheStore();
  TestPurgeOnStartClearsEvents();
  TestSubsetOfChannels();

  std::cout << "vigil_integration_pipeline: pass\n";
  return 0;
}
