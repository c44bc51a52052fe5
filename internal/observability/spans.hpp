#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace resolver::runtime::config {
class RuntimeConfig;
}

namespace resolver::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"entity-resolver"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  std::uint32_t metrics_interval_ms{1000};
};

// gRPC exports use TLS only for https:// endpoints.
bool UseTls(const std::string& endpoint);

bool InitializeTracing(const resolver::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const resolver::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// One span per pipeline stage ("resolver.run", "resolver.score", ...).
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

  void RecordRun(std::string_view status);
  void ObserveStageDurationMs(std::string_view stage, double duration_ms);
  void RecordDecisions(std::string_view decision, std::uint64_t count);
  void SetPartitionSize(std::uint64_t entities, std::uint64_t review_items);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const resolver::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const resolver::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRun(std::string_view) {
}

inline void Metrics::ObserveStageDurationMs(std::string_view, double) {
}

inline void Metrics::RecordDecisions(std::string_view, std::uint64_t) {
}

inline void Metrics::SetPartitionSize(std::uint64_t, std::uint64_t) {
}
#endif

} // namespace resolver::observability
