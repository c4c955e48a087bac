#include "internal/sensors/sensor_config_store.hpp"

#include <google/protobuf/util/message_differencer.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/sqlite/schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace vigil::agent::v1;
using google::protobuf::util::MessageDifferencer;
using vigil::db::sqlite::SqliteDB;
using vigil::model::SensorKind;
using vigil::sensors::SensorConfigStore;

std::string FreshDbPath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "vigil_sensor_config_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / (test_name + "-" + std::to_string(::getpid()) + ".db")).string();
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path + suffix);
  }
  return path;
}

std::unique_ptr<SensorConfigStore> OpenStore(const std::string& path) {
  auto db = std::make_shared<SqliteDB>(path);
  vigil::db::sqlite::BootstrapSchema(db);
  auto store = std::make_unique<SensorConfigStore>(db);
  store->EnsureDefaults();
  return store;
}

void TestDefaultsAreSeededWithoutAudit() {
  auto store = OpenStore(FreshDbPath("defaults"));
  store->EnsureDefaults();

  const auto snapshot = store->Snapshot();
  assert(MessageDifferencer::Equals(snapshot, vigil::sensors::DefaultSnapshot()));
  assert(snapshot.etw().level() == 4);
  assert(snapshot.scanner().interval_seconds() == 600);
  assert(store->ListAudit(std::nullopt, 100).empty());
}

void TestChangeIsStoredAndAudited() {
  auto store = OpenStore(FreshDbPath("audit"));

  ConfigUpdate update;
  *update.mutable_etw() = store->Snapshot().etw();
  update.mutable_etw()->set_level(5);

  const auto result = store->Apply(update, "analyst", vigil::util::FromUnixMicros(1'700'000'000'000'000));
  assert(result.changed.size() == 1);
  assert(result.changed[0] == SensorKind::kEtw);
  assert(result.message == "applied etw");
  assert(store->Snapshot().etw().level() == 5);

  const auto audit = store->ListAudit(std::nullopt, 10);
  assert(audit.size() == 1);
  assert(audit[0].kind() == SENSOR_KIND_ETW);
  assert(audit[0].actor() == "analyst");
  assert(audit[0].changed_at_ms() == 1'700'000'000'000);
  assert(audit[0].old_config().find("\"level\":4") != std::string::npos);
  assert(audit[0].new_config().find("\"level\":5") != std::string::npos);
}

void TestUnchangedConfigIsNotAudited() {
  auto store = OpenStore(FreshDbPath("unchanged"));

  ConfigUpdate update;
  *update.mutable_network() = store->Snapshot().network();

  const auto result = store->Apply(update, "analyst");
  assert(result.changed.empty());
  assert(result.message == "no changes");
  assert(store->ListAudit(std::nullopt, 10).empty());
}

void TestInvalidUpdateChangesNothing() {
  auto       store  = OpenStore(FreshDbPath("invalid"));
  const auto before = store->Snapshot();

  ConfigUpdate update;
  update.mutable_scanner()->set_enabled(false);
  update.mutable_etw()->set_level(9);

  bool threw = false;
  try {
    store->Apply(update, "analyst");
  } catch (const vigil::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(MessageDifferencer::Equals(store->Snapshot(), before));
  assert(store->ListAudit(std::nullopt, 10).empty());
}

void TestEmptyActorIsRejected() {
  auto store = OpenStore(FreshDbPath("actor"));

  ConfigUpdate update;
  update.mutable_process()->set_enabled(false);

  bool threw = false;
  try {
    store->Apply(update, "");
  } catch (const vigil::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestMultiKindUpdateAndFilteredHistory() {
  auto store = OpenStore(FreshDbPath("multi"));

  ConfigUpdate first;
  first.mutable_scanner()->set_enabled(false);
  first.mutable_network()->set_inspect_dns(true);
  first.mutable_network()->set_enabled(true);
  const auto result = store->Apply(first, "alice", vigil::util::FromUnixMicros(1'000'000));
  assert(result.message == "applied scanner, network");

  ConfigUpdate second;
  *second.mutable_network() = store->Snapshot().network();
  second.mutable_network()->add_include_ports(443);
  store->Apply(second, "bob", vigil::util::FromUnixMicros(2'000'000));

  const auto all = store->ListAudit(std::nullopt, 10);
  assert(all.size() == 3);
  assert(all[0].actor() == "bob");
  assert(all[0].id() > all[1].id() && all[1].id() > all[2].id());

  const auto network = store->ListAudit(SensorKind::kNetwork, 10);
  assert(network.size() == 2);
  for (const auto& entry : network) {
    assert(entry.kind() == SENSOR_KIND_NETWORK);
  }

  assert(store->ListAudit(std::nullopt, 1).size() == 1);
  assert(store->ListAudit(SensorKind::kEtw, 10).empty());
}

void TestConfigurationSurvivesReopen() {
  const auto path = FreshDbPath("reopen");
  {
    auto         store = OpenStore(path);
    ConfigUpdate update;
    update.mutable_fs()->set_enabled(true);
    update.mutable_fs()->set_filter_mask(FS_OPERATION_BIT_WRITE);
    update.mutable_fs()->add_path_blacklist("C:\\Windows\\Temp");
    store->Apply(update, "alice");
  }

  auto reopened = OpenStore(path);
  const auto fs = reopened->Snapshot().fs();
  assert(fs.filter_mask() == FS_OPERATION_BIT_WRITE);
  assert(fs.path_blacklist_size() == 1);
  assert(fs.path_blacklist(0) == "C:\\Windows\\Temp");
  assert(reopened->ListAudit(std::nullopt, 10).size() == 1);
}

} // namespace

void TestConcurrentReadersSeeWholeUpdates() {
  const auto path   = FreshDbPath("concurrent");
  auto       writer = OpenStore(path);
  // separate connection, as a second RPC handler would see it
  auto reader = OpenStore(path);

  constexpr std::uint32_t kUpdates = 200;
  std::atomic<bool>       done{false};

  std::thread apply([&] {
    for (std::uint32_t i = 1; i <= kUpdates; ++i) {
      ConfigUpdate update;
      *update.mutable_scanner() = vigil::sensors::DefaultSnapshot().scanner();
      *update.mutable_etw()     = vigil::sensors::DefaultSnapshot().etw();
      update.mutable_scanner()->set_interval_seconds(1000 + i);
      update.mutable_etw()->set_keywords(i);
      writer->Apply(update, "writer", vigil::util::Now());
    }
    done = true;
  });

  std::uint32_t reads = 0;
  while (!done || reads == 0) {
    const auto snapshot = reader->Snapshot();
    const auto interval = snapshot.scanner().interval_seconds();
    const auto keywords = snapshot.etw().keywords();
    if (interval == 600) {
      assert(keywords == 0xFFFFFFFFull);
    } else {
      assert(interval - 1000 == keywords);
    }

    // both halves of every applied update are in the audit together
    const auto history  = reader->ListAudit(std::nullopt, 1000);
    std::size_t scanner = 0;
    std::size_t etw     = 0;
    for (const auto& entry : history) {
      if (entry.kind() == SENSOR_KIND_SCANNER) ++scanner;
      if (entry.kind() == SENSOR_KIND_ETW) ++etw;
    }
    assert(scanner == etw);
    ++reads;
  }
  apply.join();

  const auto last = reader->Snapshot();
  assert(last.scanner().interval_seconds() == 1000 + kUpdates);
  assert(last.etw().keywords() == kUpdates);
  assert(reader->ListAudit(std::nullopt, 1000).size() == 2 * kUpdates);
}

int main() {
  TestDefaultsAreSeededWithoutAudit();
  TestChangeIsStoredAndAudited();
  TestUnchangedConfigIsNotAudited();
  TestInvalidUpdateChangesNothing();
  TestEmptyActorIsRejected();
  TestMultiKindUpdateAndFilteredHistory();
  TestConfigurationSurvivesReopen();
  TestConcurrentReadersSeeWholeUpdates();

  std::cout << "vigil_unit_sensor_config_store: pass\n";
  return 0;
}
