#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace accessres::runtime::config {
class RuntimeConfig;
}

namespace accessres::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"access-resolver"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const accessres::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide counters for the resolution pipeline.

  Compiled to no-ops unless ENABLE_OTEL is defined.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // encoding: binary|compact
  void RecordDecode(std::string_view encoding, bool success);
  // outcome: applied|ignored|invalid|expired|stale|truncated
  void RecordFrame(std::string_view outcome);
  void RecordTransition(std::string_view from, std::string_view to);
  void RecordUpgrade(bool automatic);
  void RecordFetch(std::string_view route, bool success);
  void ObserveFetchLatencyMs(std::string_view route, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const accessres::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordDecode(std::string_view, bool) {
}

inline void Metrics::RecordFrame(std::string_view) {
}

inline void Metrics::RecordTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordUpgrade(bool) {
}

inline void Metrics::RecordFetch(std::string_view, bool) {
}

inline void Metrics::ObserveFetchLatencyMs(std::string_view, double) {
}
#endif

} // namespace accessres::observability
