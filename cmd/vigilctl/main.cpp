#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "client/cpp/config_client.h"
#include "vigil/agent/v1.hpp"

using namespace vigil::agent::v1;
using vigil::agent::client::ConfigClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  vigilctl <addr> get\n"
            << "  vigilctl <addr> set <config-update-json>\n"
            << "  vigilctl <addr> set-scanner <json>\n"
            << "  vigilctl <addr> set-process <json>\n"
            << "  vigilctl <addr> set-fs <json>\n"
            << "  vigilctl <addr> set-network <json>\n"
            << "  vigilctl <addr> set-etw <json>\n"
            << "  vigilctl <addr> audit [scanner|process|filesystem|network|etw] [limit]\n"
            << "  vigilctl <addr> stats\n"
            << "The actor recorded for set commands is $VIGIL_ACTOR, else $USER.\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string out;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return out;
}

static bool FromJson(const std::string& json, google::protobuf::Message* message) {
  const auto status = google::protobuf::util::JsonStringToMessage(json, message);
  if (!status.ok()) {
    std::cerr << "invalid json: " << status.message() << "\n";
    return false;
  }
  return true;
}

static std::optional<SensorKind> ParseKind(const std::string& value) {
  if (value == "scanner") return SENSOR_KIND_SCANNER;
  if (value == "process") return SENSOR_KIND_PROCESS;
  if (value == "filesystem" || value == "fs") return SENSOR_KIND_FILESYSTEM;
  if (value == "network") return SENSOR_KIND_NETWORK;
  if (value == "etw") return SENSOR_KIND_ETW;
  return std::nullopt;
}

static std::string DefaultActor() {
  if (const char* actor = std::getenv("VIGIL_ACTOR"); actor != nullptr && *actor != '\0') {
    return actor;
  }
  if (const char* user = std::getenv("USER"); user != nullptr && *user != '\0') {
    return user;
  }
  return "vigilctl";
}

// Parses the single-kind JSON argument of set-<kind> into the update.
static bool BuildSingleUpdate(const std::string& cmd, const std::string& json, ConfigUpdate* update) {
  if (cmd == "set-scanner") return FromJson(json, update->mutable_scanner());
  if (cmd == "set-process") return FromJson(json, update->mutable_process());
  if (cmd == "set-fs") return FromJson(json, update->mutable_fs());
  if (cmd == "set-network") return FromJson(json, update->mutable_network());
  if (cmd == "set-etw") return FromJson(json, update->mutable_etw());
  std::cerr << "unknown command: " << cmd << "\n";
  return false;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  ConfigClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()), DefaultActor());

  // ------------------------------------------------------------

  if (cmd == "get") {
    GetConfigResponse resp;
    auto              status = client.GetConfig(&resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << ToJson(resp) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set" || cmd.rfind("set-", 0) == 0) {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ConfigUpdate update;
    const bool   parsed = cmd == "set" ? FromJson(argv[3], &update) : BuildSingleUpdate(cmd, argv[3], &update);
    if (!parsed) return 1;

    SetConfigResponse resp;
    auto              status = client.SetConfig(update, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    if (!resp.success()) {
      std::cerr << "rejected: " << resp.message() << "\n";
      return 3;
    }

    std::cout << resp.message() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "audit") {
    std::optional<SensorKind> kind;
    std::uint32_t             limit = 0;
    if (argc >= 4) {
      kind = ParseKind(argv[3]);
      if (!kind.has_value()) {
        std::cerr << "unknown sensor kind: " << argv[3] << "\n";
        return 1;
      }
    }
    if (argc >= 5) {
      limit = static_cast<std::uint32_t>(std::stoul(argv[4]));
    }

    ListConfigAuditResponse resp;
    auto                    status = client.ListConfigAudit(kind, limit, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& entry : resp.entries()) {
      std::cout << entry.id() << " " << SensorKind_Name(entry.kind()) << " changed_at_ms=" << entry.changed_at_ms()
                << " actor=" << entry.actor() << "\n"
                << "  old=" << entry.old_config() << "\n"
                << "  new=" << entry.new_config() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsResponse resp;
    auto          status = client.Stats(&resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& channel : resp.channels()) {
      std::cout << channel.kind() << " name=" << channel.name() << " used=" << channel.used_bytes() << "/" << channel.size_bytes()
                << " dropped=" << channel.dropped() << " frames=" << channel.frames() << " desyncs=" << channel.desyncs()
                << " decode_errors=" << channel.decode_errors() << "\n";
    }
    std::cout << "pending_events=" << resp.pending_events() << "\n";

    const auto& writer = resp.writer();
    std::cout << "writer state=" << writer.state() << " queued=" << writer.queued_events() << " dropped=" << writer.dropped_events()
              << " batches=" << writer.batches_written() << " events=" << writer.events_written()
              << " write_failures=" << writer.write_failures() << "\n";
    std::cout << "wal bytes=" << writer.wal_size_bytes() << " checkpoints=" << writer.checkpoints()
              << " forced=" << writer.forced_checkpoints() << " failures=" << writer.checkpoint_failures()
              << " retention_deleted=" << writer.retention_deleted() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
