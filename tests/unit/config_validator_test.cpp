#include "internal/sensors/config_validator.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace vigil::agent::v1;
using vigil::sensors::Validate;
using vigil::sensors::ValidateUpdate;

std::string RejectionOf(const ConfigUpdate& update) {
  try {
    ValidateUpdate(update);
  } catch (const vigil::util::InvalidArgument& e) {
    return e.what();
  }
  return {};
}

void TestScannerRules() {
  ScannerConfig scanner;
  scanner.set_enabled(true);
  scanner.set_interval_seconds(600);
  scanner.set_file_extensions(".exe, .dll,.bat");
  scanner.add_paths("C:\\Users");
  assert(Validate(scanner).empty());

  scanner.set_interval_seconds(0);
  assert(Validate(scanner).size() == 1);

  // a disabled scanner may have no interval
  scanner.set_enabled(false);
  assert(Validate(scanner).empty());

  scanner.set_file_extensions("exe,.dll,");
  assert(Validate(scanner).size() == 2);

  scanner.set_file_extensions("");
  scanner.add_paths("  ");
  assert(Validate(scanner).size() == 1);
}

void TestFilesystemRules() {
  FsConfig fs;
  fs.set_filter_mask(FS_OPERATION_BIT_CREATE | FS_OPERATION_BIT_READ);
  fs.add_path_whitelist("C:\\Windows");
  fs.add_path_blacklist("C:\\Temp");
  assert(Validate(fs).empty());

  fs.set_filter_mask(0x20);
  assert(Validate(fs).size() == 1);

  fs.set_filter_mask(0x1F);
  fs.add_path_blacklist("C:\\Windows");
  assert(Validate(fs).size() == 1);
}

void TestNetworkRules() {
  NetworkConfig network;
  network.add_include_ports(443);
  network.add_exclude_ports(53);
  assert(Validate(network).empty());

  network.add_include_ports(0);
  network.add_exclude_ports(70000);
  assert(Validate(network).size() == 2);

  network.clear_include_ports();
  network.clear_exclude_ports();
  network.add_include_ports(80);
  network.add_exclude_ports(80);
  assert(Validate(network).size() == 1);
}

void TestEtwRules() {
  EtwConfig etw;
  etw.set_level(4);
  etw.add_providers("22fb2cd6-0e7b-422b-a0c7-2fad1fd0e716");
  etw.add_providers("{54849625-5478-4994-A5BA-3E3B0328C30D}");
  assert(Validate(etw).empty());

  etw.set_level(0);
  assert(Validate(etw).size() == 1);
  etw.set_level(6);
  assert(Validate(etw).size() == 1);

  etw.set_level(1);
  etw.add_providers("Microsoft-Windows-Kernel-Process");
  assert(Validate(etw).size() == 1);
}

void TestProcessTogglesAreAlwaysValid() {
  ProcessConfig process;
  process.set_enabled(false);
  process.set_hook_termination(true);
  assert(Validate(process).empty());
}

void TestUpdateReportsEveryProblem() {
  ConfigUpdate update;
  update.mutable_etw()->set_level(9);
  update.mutable_network()->add_include_ports(0);
  update.mutable_process()->set_enabled(true);

  const auto message = RejectionOf(update);
  assert(message.find("etw: level") != std::string::npos);
  assert(message.find("network: include_ports") != std::string::npos);
  assert(message.find("; ") != std::string::npos);
}

void TestEmptyUpdateIsRejected() {
  assert(!RejectionOf(ConfigUpdate{}).empty());

  ConfigUpdate update;
  update.mutable_process();
  assert(RejectionOf(update).empty());
}

} // namespace

int main() {
  TestScannerRules();
  TestFilesystemRules();
  TestNetworkRules();
  TestEtwRules();
  TestProcessTogglesAreAlwaysValid();
  TestUpdateReportsEveryProblem();
  TestEmptyUpdateIsRejected();

  std::cout << "vigil_unit_config_validator: pass\n";
  return 0;
}
