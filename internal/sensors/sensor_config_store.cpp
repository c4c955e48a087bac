#include "sensor_config_store.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "config_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vigil::sensors {

namespace {

using agent::v1::SensorConfigSnapshot;

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::StorageError("serialize configuration: " + std::string(status.message()));
  }
  return json;
}

void Check(const db::Result& r, const char* what) {
  if (!r) {
    throw util::StorageError(std::string(what) + ": " + r.message);
  }
}

agent::v1::SensorKind ToProto(model::SensorKind kind) {
  return static_cast<agent::v1::SensorKind>(static_cast<int>(kind));
}

// Loads the current row, writes the new one and appends the audit entry
// when they differ. Returns true when the row changed.
template <typename Config>
bool ApplyOne(db::Repository& repo, db::Transaction& tx, model::SensorKind kind, const Config& next, const std::string& actor,
              std::int64_t changed_at_ms) {
  Config current;
  auto   loaded = repo.LoadConfig(tx, current);
  if (!loaded && loaded.code != db::ErrorCode::NotFound) {
    Check(loaded, "load configuration");
  }

  if (loaded && google::protobuf::util::MessageDifferencer::Equals(current, next)) {
    return false;
  }

  Check(repo.SaveConfig(tx, next), "save configuration");

  db::model::ConfigAuditRecord record;
  record.sensor_type   = std::string(model::ToString(kind));
  record.changed_at_ms = changed_at_ms;
  record.actor         = actor;
  record.old_config    = loaded ? ToJson(current) : "{}";
  record.new_config    = ToJson(next);
  Check(repo.AppendAudit(tx, record), "append audit entry");
  return true;
}

template <typename Config>
void SeedOne(db::Repository& repo, db::Transaction& tx, model::SensorKind kind, const Config& defaults) {
  Config current;
  auto   loaded = repo.LoadConfig(tx, current);
  if (loaded) {
    return;
  }
  if (loaded.code != db::ErrorCode::NotFound) {
    Check(loaded, "load configuration");
  }
  Check(repo.SaveConfig(tx, defaults), "seed configuration");
  VIGIL_LOG_INFO("seeded default sensor configuration", {observability::StringField("sensor", model::ToString(kind))});
}

template <typename Config>
void LoadInto(db::Repository& repo, db::Transaction& tx, Config* out) {
  auto r = repo.LoadConfig(tx, *out);
  if (r.code == db::ErrorCode::NotFound) {
    throw util::NotFound("sensor configuration row missing");
  }
  Check(r, "load configuration");
}

} // namespace

SensorConfigSnapshot DefaultSnapshot() {
  SensorConfigSnapshot s;

  auto* scanner = s.mutable_scanner();
  scanner->set_enabled(true);
  scanner->set_interval_seconds(600);
  scanner->set_recursive(true);
  scanner->set_file_extensions(".exe,.dll,.bat");

  auto* process = s.mutable_process();
  process->set_enabled(true);
  process->set_hook_creation(true);
  process->set_hook_termination(false);
  process->set_detect_remote_threads(true);

  auto* fs = s.mutable_fs();
  fs->set_enabled(true);
  fs->set_filter_mask(kFsOperationMask);

  auto* network = s.mutable_network();
  network->set_enabled(true);
  network->set_inspect_dns(false);

  auto* etw = s.mutable_etw();
  etw->set_enabled(true);
  etw->set_level(4);
  etw->set_keywords(0xFFFFFFFFull);
  return s;
}

SensorConfigStore::SensorConfigStore(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)), repo_(db_) {
}

void SensorConfigStore::EnsureDefaults() {
  std::lock_guard lock(mutex_);
  const auto      defaults = DefaultSnapshot();

  auto tx = repo_.Begin();
  SeedOne(repo_, *tx, model::SensorKind::kScanner, defaults.scanner());
  SeedOne(repo_, *tx, model::SensorKind::kProcess, defaults.process());
  SeedOne(repo_, *tx, model::SensorKind::kFilesystem, defaults.fs());
  SeedOne(repo_, *tx, model::SensorKind::kNetwork, defaults.network());
  SeedOne(repo_, *tx, model::SensorKind::kEtw, defaults.etw());
  tx->Commit();
}

SensorConfigSnapshot SensorConfigStore::Snapshot() {
  std::lock_guard lock(mutex_);

  SensorConfigSnapshot s;
  auto                 tx = repo_.BeginRead();
  LoadInto(repo_, *tx, s.mutable_scanner());
  LoadInto(repo_, *tx, s.mutable_process());
  LoadInto(repo_, *tx, s.mutable_fs());
  LoadInto(repo_, *tx, s.mutable_network());
  LoadInto(repo_, *tx, s.mutable_etw());
  tx->Commit();
  return s;
}

ApplyResult SensorConfigStore::Apply(const agent::v1::ConfigUpdate& update, const std::string& actor, util::TimePoint now) {
  ValidateUpdate(update);
  if (actor.empty()) {
    throw util::InvalidArgument("actor is required");
  }

  std::lock_guard lock(mutex_);
  const auto      changed_at = static_cast<std::int64_t>(util::ToUnixMillis(now));

  ApplyResult result;
  auto        tx = repo_.Begin();

  if (update.has_scanner() && ApplyOne(repo_, *tx, model::SensorKind::kScanner, update.scanner(), actor, changed_at)) {
    result.changed.push_back(model::SensorKind::kScanner);
  }
  if (update.has_process() && ApplyOne(repo_, *tx, model::SensorKind::kProcess, update.process(), actor, changed_at)) {
    result.changed.push_back(model::SensorKind::kProcess);
  }
  if (update.has_fs() && ApplyOne(repo_, *tx, model::SensorKind::kFilesystem, update.fs(), actor, changed_at)) {
    result.changed.push_back(model::SensorKind::kFilesystem);
  }
  if (update.has_network() && ApplyOne(repo_, *tx, model::SensorKind::kNetwork, update.network(), actor, changed_at)) {
    result.changed.push_back(model::SensorKind::kNetwork);
  }
  if (update.has_etw() && ApplyOne(repo_, *tx, model::SensorKind::kEtw, update.etw(), actor, changed_at)) {
    result.changed.push_back(model::SensorKind::kEtw);
  }

  tx->Commit();

  if (result.changed.empty()) {
    result.message = "no changes";
  } else {
    result.message = "applied";
    for (std::size_t i = 0; i < result.changed.size(); ++i) {
      result.message += i == 0 ? " " : ", ";
      result.message += model::ToString(result.changed[i]);
    }
  }

  VIGIL_LOG_INFO("sensor configuration applied",
                 {observability::StringField("actor", actor), observability::UintField("changed", result.changed.size())});
  return result;
}

std::vector<agent::v1::ConfigAuditEntry> SensorConfigStore::ListAudit(std::optional<model::SensorKind> kind, std::size_t limit) {
  std::lock_guard lock(mutex_);

  std::optional<std::string> sensor_type;
  if (kind) {
    sensor_type = std::string(model::ToString(*kind));
  }

  auto tx      = repo_.BeginRead();
  auto records = repo_.ListAudit(*tx, sensor_type, limit);
  tx->Commit();

  std::vector<agent::v1::ConfigAuditEntry> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    agent::v1::ConfigAuditEntry e;
    e.set_id(r.id);
    if (auto parsed = model::ParseSensorKind(r.sensor_type)) {
      e.set_kind(ToProto(*parsed));
    }
    e.set_changed_at_ms(r.changed_at_ms);
    e.set_actor(r.actor);
    e.set_old_config(r.old_config);
    e.set_new_config(r.new_config);
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace vigil::sensors
