#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace recsync::runtime::config {
class RuntimeConfig;
}

namespace recsync::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"recsync-agent"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const recsync::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const recsync::runtime::config::RuntimeConfig& config);
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

/*
  Upload pipeline instruments.

    recsync.transfer.count         attempts by path (single/multipart) and outcome
    recsync.transfer.duration_ms   per-attempt wall time
    recsync.upload.in_flight       transfers currently running
    recsync.chunk.terminal.count   terminal chunk transitions by status
    recsync.rpc.count              admin RPCs by route and success
    recsync.rpc.duration_ms        admin RPC latency by route
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordTransfer(std::string_view path, std::string_view outcome);
  void ObserveTransferDurationMs(std::string_view path, double duration_ms);
  void SetInFlight(std::int64_t in_flight);
  void RecordChunkOutcome(std::string_view status);
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const recsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const recsync::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordTransfer(std::string_view, std::string_view) {
}

inline void Metrics::ObserveTransferDurationMs(std::string_view, double) {
}

inline void Metrics::SetInFlight(std::int64_t) {
}

inline void Metrics::RecordChunkOutcome(std::string_view) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
#endif

} // namespace recsync::observability
