#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vigil::model {

/*
  Fixed key set of the configuration store: exactly one current
  configuration row per kind.
*/
enum class SensorKind : std::uint8_t {
  kScanner    = 1,
  kProcess    = 2,
  kFilesystem = 3,
  kNetwork    = 4,
  kEtw        = 5,
};

inline constexpr std::array<SensorKind, 5> kAllSensorKinds = {
    SensorKind::kScanner, SensorKind::kProcess, SensorKind::kFilesystem, SensorKind::kNetwork, SensorKind::kEtw};

constexpr std::string_view ToString(SensorKind kind) {
  switch (kind) {
    case SensorKind::kScanner:
      return "scanner";
    case SensorKind::kProcess:
      return "process";
    case SensorKind::kFilesystem:
      return "filesystem";
    case SensorKind::kNetwork:
      return "network";
    case SensorKind::kEtw:
      return "etw";
  }
  return "unknown";
}

constexpr std::string_view ConfigTable(SensorKind kind) {
  switch (kind) {
    case SensorKind::kScanner:
      return "scanner_config";
    case SensorKind::kProcess:
      return "process_config";
    case SensorKind::kFilesystem:
      return "fs_config";
    case SensorKind::kNetwork:
      return "network_config";
    case SensorKind::kEtw:
      return "etw_config";
  }
  return "";
}

constexpr std::optional<SensorKind> ParseSensorKind(std::string_view name) {
  for (auto kind : kAllSensorKinds) {
    if (ToString(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace vigil::model
