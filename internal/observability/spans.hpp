#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vigil::runtime::config {
class RuntimeConfig;
}

namespace vigil::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

inline constexpr char kInstrumentationName[] = "vigil.agent";
inline constexpr char kAgentVersion[]         = "0.1.0";

struct OtlpConfig {
  std::string   service_name{"vigil-agent"};
  // channel name prefix; tells apart agents sharing a host
  std::string   instance_id{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ToOtlpConfig(const vigil::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const vigil::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const vigil::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void SetChannelDropped(std::string_view channel, std::uint64_t dropped);
  void RecordDecodeError(std::string_view channel);
  void RecordBatchFlush(std::string_view table, std::uint64_t events);
  void ObserveStoreWriteMs(std::string_view table, double duration_ms);
  void RecordQueueDrops(std::uint64_t events);
  void RecordCheckpoint(bool forced, bool success);
  void RecordRetentionDeleted(std::string_view table, std::uint64_t rows);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const vigil::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const vigil::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::SetChannelDropped(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordDecodeError(std::string_view) {
}

inline void Metrics::RecordBatchFlush(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveStoreWriteMs(std::string_view, double) {
}

inline void Metrics::RecordQueueDrops(std::uint64_t) {
}

inline void Metrics::RecordCheckpoint(bool, bool) {
}

inline void Metrics::RecordRetentionDeleted(std::string_view, std::uint64_t) {
}
#endif

} // namespace vigil::observability
