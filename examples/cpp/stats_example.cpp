#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <string>

#include "client/cpp/config_client.h"
#include "vigil/agent/v1.hpp"

int main(int argc, char** argv) {
  // Allow optional endpoint override for local/remote diagnostics.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  vigil::agent::client::ConfigClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Stats reports ring channel pressure and the store writer's progress.
  vigil::agent::v1::StatsResponse stats;
  const auto                      status = client.Stats(&stats);
  if (!status.ok()) {
    std::cerr << "Stats RPC failed: " << status.error_message() << '\n';
    return 1;
  }

  std::cout << "vigil agent stats for " << target << '\n';
  for (const auto& channel : stats.channels()) {
    std::cout << channel.kind() << ": used=" << channel.used_bytes() << "/" << channel.size_bytes() << ", dropped=" << channel.dropped()
              << ", frames=" << channel.frames() << '\n';
  }
  std::cout << "writer: state=" << stats.writer().state() << ", events_written=" << stats.writer().events_written()
            << ", wal_bytes=" << stats.writer().wal_size_bytes() << '\n';

  return 0;
}
