#include "sqlite_repository.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string_view>

namespace vigil::db::sqlite {

using vigil::db::ErrorCode;
using vigil::db::Result;
using vigil::model::ChannelKind;
using vigil::model::Event;

namespace {

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

// List columns hold JSON arrays, written through protobuf's ListValue.
template <typename Repeated>
std::string StringsToJson(const Repeated& values) {
  google::protobuf::ListValue list;
  for (const auto& v : values) {
    list.add_values()->set_string_value(v);
  }
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(list, &json).ok()) {
    return "[]";
  }
  return json;
}

template <typename Repeated>
std::string NumbersToJson(const Repeated& values) {
  google::protobuf::ListValue list;
  for (auto v : values) {
    list.add_values()->set_number_value(static_cast<double>(v));
  }
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(list, &json).ok()) {
    return "[]";
  }
  return json;
}

bool ParseList(const std::string& json, google::protobuf::ListValue& list) {
  if (json.empty()) {
    return true;
  }
  return google::protobuf::util::JsonStringToMessage(json, &list).ok();
}

template <typename Repeated>
bool JsonToStrings(const std::string& json, Repeated* out) {
  google::protobuf::ListValue list;
  if (!ParseList(json, list)) {
    return false;
  }
  for (const auto& v : list.values()) {
    if (v.kind_case() != google::protobuf::Value::kStringValue) {
      return false;
    }
    out->Add(std::string(v.string_value()));
  }
  return true;
}

template <typename Repeated>
bool JsonToNumbers(const std::string& json, Repeated* out) {
  google::protobuf::ListValue list;
  if (!ParseList(json, list)) {
    return false;
  }
  for (const auto& v : list.values()) {
    if (v.kind_case() != google::protobuf::Value::kNumberValue || v.number_value() < 0) {
      return false;
    }
    out->Add(static_cast<std::uint32_t>(v.number_value()));
  }
  return true;
}

const char* InsertSql(ChannelKind kind) {
  switch (kind) {
    case ChannelKind::kFilesystem:
      return "INSERT INTO fs_events(ts,sensor_id,op,path,new_path,pid,exe_path,size,sha256,result) VALUES(?,?,?,?,?,?,?,?,?,?);";
    case ChannelKind::kNetwork:
      return "INSERT INTO network_events(ts,sensor_id,direction,proto,src_ip,src_port,dst_ip,dst_port,pid,exe_path,bytes,verdict,rule_id) "
             "VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";
    case ChannelKind::kEtw:
      return "INSERT INTO etw_events(ts,sensor_id,provider_guid,event_id,level,pid,tid,json_payload) VALUES(?,?,?,?,?,?,?,?);";
    case ChannelKind::kProcess:
      return "INSERT INTO process_events(ts,sensor_id,op,pid,ppid,exe_path,cmdline) VALUES(?,?,?,?,?,?,?);";
  }
  return nullptr;
}

void BindEvent(sqlite3_stmt* st, const Event& e, const vigil::model::FileEvent& f) {
  BindI64(st, 1, util::ToUnixMicros(e.timestamp));
  BindText(st, 2, e.sensor_id);
  BindText(st, 3, vigil::model::ToString(f.operation));
  BindText(st, 4, f.path);
  if (f.new_path) {
    BindText(st, 5, *f.new_path);
  } else {
    sqlite3_bind_null(st, 5);
  }
  BindU64(st, 6, e.pid);
  BindText(st, 7, e.exe_path);
  BindU64(st, 8, f.size);
  if (f.content_hash.empty()) {
    sqlite3_bind_null(st, 9);
  } else {
    BindText(st, 9, vigil::model::HexEncode(f.content_hash));
  }
  BindText(st, 10, vigil::model::ToString(f.result));
}

void BindEvent(sqlite3_stmt* st, const Event& e, const vigil::model::NetworkEvent& n) {
  BindI64(st, 1, util::ToUnixMicros(e.timestamp));
  BindText(st, 2, e.sensor_id);
  BindText(st, 3, vigil::model::ToString(n.direction));
  BindText(st, 4, vigil::model::ProtocolName(n.protocol));
  BindText(st, 5, n.source.ToString());
  BindU64(st, 6, n.source_port);
  BindText(st, 7, n.destination.ToString());
  BindU64(st, 8, n.destination_port);
  BindU64(st, 9, e.pid);
  BindText(st, 10, e.exe_path);
  BindU64(st, 11, n.byte_count);
  BindText(st, 12, vigil::model::ToString(n.verdict));
  BindText(st, 13, n.rule_id);
}

void BindEvent(sqlite3_stmt* st, const Event& e, const vigil::model::EtwEvent& w) {
  BindI64(st, 1, util::ToUnixMicros(e.timestamp));
  BindText(st, 2, e.sensor_id);
  BindText(st, 3, vigil::model::GuidToString(w.provider_id));
  BindU64(st, 4, w.event_id);
  BindU64(st, 5, w.level);
  BindU64(st, 6, e.pid);
  BindU64(st, 7, w.thread_id);
  BindText(st, 8, w.payload);
}

void BindEvent(sqlite3_stmt* st, const Event& e, const vigil::model::ProcessEvent& p) {
  BindI64(st, 1, util::ToUnixMicros(e.timestamp));
  BindText(st, 2, e.sensor_id);
  BindText(st, 3, vigil::model::ToString(p.operation));
  BindU64(st, 4, e.pid);
  BindU64(st, 5, p.parent_pid);
  BindText(st, 6, e.exe_path);
  BindText(st, 7, p.command_line);
}

std::string Table(ChannelKind kind) {
  return std::string(vigil::model::TableName(kind));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kDeferred);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_FULL:
      return Result::Err(ErrorCode::Full, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvents(Transaction& t, ChannelKind kind, const std::vector<Event>& events) {
  auto* db  = TX(t).Handle();
  auto* sql = InsertSql(kind);
  if (!sql) return Result::Err(ErrorCode::InternalError, "no event table for channel kind");

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  for (const auto& event : events) {
    if (vigil::model::KindOf(event) != kind) {
      return Result::Err(ErrorCode::ConstraintViolation, "event kind does not match table " + Table(kind));
    }

    std::visit([&](const auto& payload) { BindEvent(st.get(), event, payload); }, event.payload);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());
  }
  return Result::Ok();
}

Result SqliteRepository::DeleteEventsBefore(Transaction& t, ChannelKind kind, std::int64_t cutoff_micros, std::uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  const auto    sql = "DELETE FROM " + Table(kind) + " WHERE ts < ?;";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindI64(st.get(), 1, cutoff_micros);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  deleted = static_cast<std::uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

Result SqliteRepository::PurgeEvents(Transaction& t, ChannelKind kind, std::uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  const auto sql = "DELETE FROM " + Table(kind) + ";";
  int        rc  = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  deleted = static_cast<std::uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

std::optional<std::uint64_t> SqliteRepository::CountEvents(Transaction& t, ChannelKind kind) {
  auto* db = TX(t).Handle();

  const auto    sql = "SELECT COUNT(*) FROM " + Table(kind) + ";";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) return std::nullopt;
  Statement st(raw);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return static_cast<std::uint64_t>(ColI64(st.get(), 0));
}

// ------------------------------------------------------------------
// Sensor configuration
// ------------------------------------------------------------------

namespace {

// Runs a single-row SELECT; NotFound when the singleton row is absent.
template <typename Fill>
Result SelectSingleton(sqlite3* db, const char* sql, Fill&& fill) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "configuration row missing");
  if (rc != SQLITE_ROW) return SqliteRepository::Translate(db, rc);

  if (!fill(st.get())) return Result::Err(ErrorCode::Corruption, "malformed list column");
  return Result::Ok();
}

template <typename Bind>
Result UpsertSingleton(sqlite3* db, const char* sql, Bind&& bind) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  bind(st.get());
  int rc = sqlite3_step(st.get());
  return SqliteRepository::Translate(db, rc);
}

} // namespace

Result SqliteRepository::LoadConfig(Transaction& t, agent::v1::ScannerConfig& out) {
  out.Clear();
  return SelectSingleton(TX(t).Handle(), "SELECT enabled,interval_seconds,recursive,file_extensions,paths FROM scanner_config WHERE id=1;",
                         [&](sqlite3_stmt* st) {
                           out.set_enabled(ColBool(st, 0));
                           out.set_interval_seconds(static_cast<std::uint32_t>(ColI64(st, 1)));
                           out.set_recursive(ColBool(st, 2));
                           out.set_file_extensions(ColText(st, 3));
                           return JsonToStrings(ColText(st, 4), out.mutable_paths());
                         });
}

Result SqliteRepository::LoadConfig(Transaction& t, agent::v1::ProcessConfig& out) {
  out.Clear();
  return SelectSingleton(TX(t).Handle(),
                         "SELECT enabled,hook_creation,hook_termination,detect_remote_threads FROM process_config WHERE id=1;",
                         [&](sqlite3_stmt* st) {
                           out.set_enabled(ColBool(st, 0));
                           out.set_hook_creation(ColBool(st, 1));
                           out.set_hook_termination(ColBool(st, 2));
                           out.set_detect_remote_threads(ColBool(st, 3));
                           return true;
                         });
}

Result SqliteRepository::LoadConfig(Transaction& t, agent::v1::FsConfig& out) {
  out.Clear();
  return SelectSingleton(TX(t).Handle(), "SELECT enabled,filter_mask,path_whitelist,path_blacklist FROM fs_config WHERE id=1;",
                         [&](sqlite3_stmt* st) {
                           out.set_enabled(ColBool(st, 0));
                           out.set_filter_mask(static_cast<std::uint32_t>(ColI64(st, 1)));
                           return JsonToStrings(ColText(st, 2), out.mutable_path_whitelist()) &&
                                  JsonToStrings(ColText(st, 3), out.mutable_path_blacklist());
                         });
}

Result SqliteRepository::LoadConfig(Transaction& t, agent::v1::NetworkConfig& out) {
  out.Clear();
  return SelectSingleton(TX(t).Handle(), "SELECT enabled,inspect_dns,include_ports,exclude_ports FROM network_config WHERE id=1;",
                         [&](sqlite3_stmt* st) {
                           out.set_enabled(ColBool(st, 0));
                           out.set_inspect_dns(ColBool(st, 1));
                           return JsonToNumbers(ColText(st, 2), out.mutable_include_ports()) &&
                                  JsonToNumbers(ColText(st, 3), out.mutable_exclude_ports());
                         });
}

Result SqliteRepository::LoadConfig(Transaction& t, agent::v1::EtwConfig& out) {
  out.Clear();
  return SelectSingleton(TX(t).Handle(), "SELECT enabled,level,keywords,providers FROM etw_config WHERE id=1;", [&](sqlite3_stmt* st) {
    out.set_enabled(ColBool(st, 0));
    out.set_level(static_cast<std::uint32_t>(ColI64(st, 1)));
    out.set_keywords(static_cast<std::uint64_t>(ColI64(st, 2)));
    return JsonToStrings(ColText(st, 3), out.mutable_providers());
  });
}

Result SqliteRepository::SaveConfig(Transaction& t, const agent::v1::ScannerConfig& c) {
  return UpsertSingleton(TX(t).Handle(),
                         "INSERT INTO scanner_config(id,enabled,interval_seconds,recursive,file_extensions,paths) VALUES(1,?,?,?,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET enabled=excluded.enabled,interval_seconds=excluded.interval_seconds,"
                         "recursive=excluded.recursive,file_extensions=excluded.file_extensions,paths=excluded.paths;",
                         [&](sqlite3_stmt* st) {
                           BindBool(st, 1, c.enabled());
                           BindU64(st, 2, c.interval_seconds());
                           BindBool(st, 3, c.recursive());
                           BindText(st, 4, c.file_extensions());
                           BindText(st, 5, StringsToJson(c.paths()));
                         });
}

Result SqliteRepository::SaveConfig(Transaction& t, const agent::v1::ProcessConfig& c) {
  return UpsertSingleton(TX(t).Handle(),
                         "INSERT INTO process_config(id,enabled,hook_creation,hook_termination,detect_remote_threads) VALUES(1,?,?,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET enabled=excluded.enabled,hook_creation=excluded.hook_creation,"
                         "hook_termination=excluded.hook_termination,detect_remote_threads=excluded.detect_remote_threads;",
                         [&](sqlite3_stmt* st) {
                           BindBool(st, 1, c.enabled());
                           BindBool(st, 2, c.hook_creation());
                           BindBool(st, 3, c.hook_termination());
                           BindBool(st, 4, c.detect_remote_threads());
                         });
}

Result SqliteRepository::SaveConfig(Transaction& t, const agent::v1::FsConfig& c) {
  return UpsertSingleton(TX(t).Handle(),
                         "INSERT INTO fs_config(id,enabled,filter_mask,path_whitelist,path_blacklist) VALUES(1,?,?,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET enabled=excluded.enabled,filter_mask=excluded.filter_mask,"
                         "path_whitelist=excluded.path_whitelist,path_blacklist=excluded.path_blacklist;",
                         [&](sqlite3_stmt* st) {
                           BindBool(st, 1, c.enabled());
                           BindU64(st, 2, c.filter_mask());
                           BindText(st, 3, StringsToJson(c.path_whitelist()));
                           BindText(st, 4, StringsToJson(c.path_blacklist()));
                         });
}

Result SqliteRepository::SaveConfig(Transaction& t, const agent::v1::NetworkConfig& c) {
  return UpsertSingleton(TX(t).Handle(),
                         "INSERT INTO network_config(id,enabled,inspect_dns,include_ports,exclude_ports) VALUES(1,?,?,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET enabled=excluded.enabled,inspect_dns=excluded.inspect_dns,"
                         "include_ports=excluded.include_ports,exclude_ports=excluded.exclude_ports;",
                         [&](sqlite3_stmt* st) {
                           BindBool(st, 1, c.enabled());
                           BindBool(st, 2, c.inspect_dns());
                           BindText(st, 3, NumbersToJson(c.include_ports()));
                           BindText(st, 4, NumbersToJson(c.exclude_ports()));
                         });
}

Result SqliteRepository::SaveConfig(Transaction& t, const agent::v1::EtwConfig& c) {
  return UpsertSingleton(TX(t).Handle(),
                         "INSERT INTO etw_config(id,enabled,level,keywords,providers) VALUES(1,?,?,?,?) "
                         "ON CONFLICT(id) DO UPDATE SET enabled=excluded.enabled,level=excluded.level,"
                         "keywords=excluded.keywords,providers=excluded.providers;",
                         [&](sqlite3_stmt* st) {
                           BindBool(st, 1, c.enabled());
                           BindU64(st, 2, c.level());
                           BindU64(st, 3, c.keywords());
                           BindText(st, 4, StringsToJson(c.providers()));
                         });
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAudit(Transaction& t, model::ConfigAuditRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO config_audit(sensor_type,changed_at,actor,old_config,new_config) VALUES(?,?,?,?,?);";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Statement st(raw);

  BindText(st.get(), 1, r.sensor_type);
  BindI64(st.get(), 2, r.changed_at_ms);
  BindText(st.get(), 3, r.actor);
  BindText(st.get(), 4, r.old_config);
  BindText(st.get(), 5, r.new_config);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::ConfigAuditRecord> SqliteRepository::ListAudit(Transaction& t, const std::optional<std::string>& sensor_type,
                                                                 std::size_t limit) {
  auto* db = TX(t).Handle();
  std::vector<model::ConfigAuditRecord> out;

  const char* sql = sensor_type ? "SELECT id,sensor_type,changed_at,actor,old_config,new_config FROM config_audit "
                                  "WHERE sensor_type=? ORDER BY id DESC LIMIT ?;"
                                : "SELECT id,sensor_type,changed_at,actor,old_config,new_config FROM config_audit "
                                  "ORDER BY id DESC LIMIT ?;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) return out;
  Statement st(raw);

  int idx = 1;
  if (sensor_type) BindText(st.get(), idx++, *sensor_type);
  BindI64(st.get(), idx, static_cast<std::int64_t>(limit));

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::ConfigAuditRecord r;
    r.id            = ColI64(st.get(), 0);
    r.sensor_type   = ColText(st.get(), 1);
    r.changed_at_ms = ColI64(st.get(), 2);
    r.actor         = ColText(st.get(), 3);
    r.old_config    = ColText(st.get(), 4);
    r.new_config    = ColText(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace vigil::db::sqlite
