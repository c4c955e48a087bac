#include "config_validator.hpp"

#include <set>
#include <string_view>

#include "internal/model/event.hpp"
#include "internal/util/errors.hpp"

namespace vigil::sensors {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

template <typename Repeated>
void CheckPaths(const Repeated& paths, const char* field, std::vector<std::string>& problems) {
  for (int i = 0; i < paths.size(); ++i) {
    if (Trim(paths.Get(i)).empty()) {
      problems.push_back(std::string(field) + "[" + std::to_string(i) + "] is empty");
    }
  }
}

template <typename Repeated>
void CheckPorts(const Repeated& ports, const char* field, std::vector<std::string>& problems) {
  for (auto port : ports) {
    if (port < 1 || port > 65535) {
      problems.push_back(std::string(field) + " contains invalid port " + std::to_string(port));
    }
  }
}

void Prefix(const char* sensor, std::vector<std::string>& problems, std::vector<std::string>& out) {
  for (auto& p : problems) {
    out.push_back(std::string(sensor) + ": " + p);
  }
}

} // namespace

std::vector<std::string> Validate(const agent::v1::ScannerConfig& config) {
  std::vector<std::string> problems;
  if (config.enabled() && config.interval_seconds() == 0) {
    problems.push_back("interval_seconds must be positive when enabled");
  }

  std::string_view rest = config.file_extensions();
  while (!rest.empty()) {
    const auto comma = rest.find(',');
    const auto ext   = Trim(rest.substr(0, comma));
    if (ext.size() < 2 || ext.front() != '.') {
      problems.push_back("file extension '" + std::string(ext) + "' must look like .ext");
    }
    if (comma == std::string_view::npos) break;
    rest.remove_prefix(comma + 1);
    if (rest.empty()) {
      problems.push_back("file_extensions ends with a separator");
    }
  }

  CheckPaths(config.paths(), "paths", problems);
  return problems;
}

std::vector<std::string> Validate(const agent::v1::ProcessConfig&) {
  // hook toggles only, every combination is valid
  return {};
}

std::vector<std::string> Validate(const agent::v1::FsConfig& config) {
  std::vector<std::string> problems;
  if ((config.filter_mask() & ~kFsOperationMask) != 0) {
    problems.push_back("filter_mask has bits outside 0x1F");
  }
  CheckPaths(config.path_whitelist(), "path_whitelist", problems);
  CheckPaths(config.path_blacklist(), "path_blacklist", problems);

  std::set<std::string> allowed(config.path_whitelist().begin(), config.path_whitelist().end());
  for (const auto& path : config.path_blacklist()) {
    if (allowed.count(path)) {
      problems.push_back("path '" + path + "' is both whitelisted and blacklisted");
    }
  }
  return problems;
}

std::vector<std::string> Validate(const agent::v1::NetworkConfig& config) {
  std::vector<std::string> problems;
  CheckPorts(config.include_ports(), "include_ports", problems);
  CheckPorts(config.exclude_ports(), "exclude_ports", problems);

  std::set<std::uint32_t> included(config.include_ports().begin(), config.include_ports().end());
  for (auto port : config.exclude_ports()) {
    if (included.count(port)) {
      problems.push_back("port " + std::to_string(port) + " is both included and excluded");
    }
  }
  return problems;
}

std::vector<std::string> Validate(const agent::v1::EtwConfig& config) {
  std::vector<std::string> problems;
  if (config.level() < kMinEtwLevel || config.level() > kMaxEtwLevel) {
    problems.push_back("level must be between 1 and 5, got " + std::to_string(config.level()));
  }
  for (const auto& provider : config.providers()) {
    if (!model::ParseGuid(provider)) {
      problems.push_back("provider '" + provider + "' is not a GUID");
    }
  }
  return problems;
}

void ValidateUpdate(const agent::v1::ConfigUpdate& update) {
  if (!update.has_scanner() && !update.has_process() && !update.has_fs() && !update.has_network() && !update.has_etw()) {
    throw util::InvalidArgument("update carries no configuration");
  }

  std::vector<std::string> all;
  if (update.has_scanner()) {
    auto p = Validate(update.scanner());
    Prefix("scanner", p, all);
  }
  if (update.has_process()) {
    auto p = Validate(update.process());
    Prefix("process", p, all);
  }
  if (update.has_fs()) {
    auto p = Validate(update.fs());
    Prefix("filesystem", p, all);
  }
  if (update.has_network()) {
    auto p = Validate(update.network());
    Prefix("network", p, all);
  }
  if (update.has_etw()) {
    auto p = Validate(update.etw());
    Prefix("etw", p, all);
  }

  if (!all.empty()) {
    std::string message = "invalid configuration: ";
    for (std::size_t i = 0; i < all.size(); ++i) {
      if (i > 0) message += "; ";
      message += all[i];
    }
    throw util::InvalidArgument(message);
  }
}

} // namespace vigil::sensors
