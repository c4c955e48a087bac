#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/config_client.h"
#include "vigil/agent/v1.hpp"

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  vigil::agent::client::ConfigClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()), "config-example");

  vigil::agent::v1::GetConfigResponse current;
  auto                                status = client.GetConfig(&current);
  if (!status.ok()) {
    std::cerr << "GetConfig RPC failed: " << status.error_message() << '\n';
    return 1;
  }
  std::cout << "etw level=" << current.etw().level() << ", providers=" << current.etw().providers_size() << '\n';

  // Raise ETW verbosity and narrow the network sensor in one atomic update.
  vigil::agent::v1::ConfigUpdate update;
  *update.mutable_etw() = current.etw();
  update.mutable_etw()->set_level(5);
  *update.mutable_network() = current.network();
  update.mutable_network()->clear_include_ports();
  update.mutable_network()->add_include_ports(443);

  vigil::agent::v1::SetConfigResponse applied;
  status = client.SetConfig(update, &applied);
  if (!status.ok()) {
    std::cerr << "SetConfig RPC failed: " << status.error_message() << '\n';
    return 1;
  }
  if (!applied.success()) {
    std::cerr << "update rejected: " << applied.message() << '\n';
    return 1;
  }
  std::cout << applied.message() << '\n';

  vigil::agent::v1::ListConfigAuditResponse audit;
  status = client.ListConfigAudit(std::nullopt, 5, &audit);
  if (!status.ok()) {
    std::cerr << "ListConfigAudit RPC failed: " << status.error_message() << '\n';
    return 1;
  }
  for (const auto& entry : audit.entries()) {
    std::cout << entry.id() << " " << vigil::agent::v1::SensorKind_Name(entry.kind()) << " by " << entry.actor() << '\n';
  }
  return 0;
}
