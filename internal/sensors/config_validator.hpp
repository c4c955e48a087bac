#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vigil/agent/v1/sensor_config.pb.h"

namespace vigil::sensors {

inline constexpr std::uint32_t kFsOperationMask = 0x1F;
inline constexpr std::uint32_t kMinEtwLevel     = 1;
inline constexpr std::uint32_t kMaxEtwLevel     = 5;

/*
  Structural checks only: ranges, formats and internal consistency of one
  configuration. Whether a path exists or a provider is registered on
  this host is not checked.

  Each function returns the list of problems, empty when valid.
*/
std::vector<std::string> Validate(const agent::v1::ScannerConfig& config);
std::vector<std::string> Validate(const agent::v1::ProcessConfig& config);
std::vector<std::string> Validate(const agent::v1::FsConfig& config);
std::vector<std::string> Validate(const agent::v1::NetworkConfig& config);
std::vector<std::string> Validate(const agent::v1::EtwConfig& config);

// Validates every configuration present in the update. Throws
// util::InvalidArgument listing all problems, or when the update is empty.
void ValidateUpdate(const agent::v1::ConfigUpdate& update);

} // namespace vigil::sensors
