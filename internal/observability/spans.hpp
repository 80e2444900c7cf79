#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vigil::runtime::config {
class ObservabilityConfig;
}

namespace vigil::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"vigil"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const vigil::runtime::config::ObservabilityConfig& config);
bool InitializeMetrics(const vigil::runtime::config::ObservabilityConfig& config);
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

  // outcome: enqueued, unresolved, exempt, sampled, filtered, overflow
  void RecordCaptureOutcome(std::string_view outcome);
  void ObserveSpoolWriteMs(double duration_ms);
  void SetSpoolBytes(std::string_view spool_dir, std::uint64_t bytes);

  // outcome: accepted, transient, permanent
  void RecordUpload(std::string_view outcome);

  // outcome: sent, failed, skipped, dropped
  void RecordDispatch(std::string_view module, std::string_view outcome);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const vigil::runtime::config::ObservabilityConfig&) {
  return false;
}

inline bool InitializeMetrics(const vigil::runtime::config::ObservabilityConfig&) {
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

inline void Metrics::RecordCaptureOutcome(std::string_view) {
}

inline void Metrics::ObserveSpoolWriteMs(double) {
}

inline void Metrics::SetSpoolBytes(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordUpload(std::string_view) {
}

inline void Metrics::RecordDispatch(std::string_view, std::string_view) {
}
#endif

} // namespace vigil::observability
