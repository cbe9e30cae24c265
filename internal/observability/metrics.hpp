#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace swarm::runtime::config {
class RuntimeConfig;
}

namespace swarm::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"s3swarm"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Run counters. Every call is a no-op unless built with ENABLE_OTEL and
  metrics were initialized.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // outcome: completed | failed | skipped | abandoned | retry
  void RecordTaskOutcome(std::string_view outcome);
  void AddTransferredBytes(std::uint64_t bytes);
  void ObserveTransferDurationMs(double duration_ms);
  void RecordCredentialRefresh(bool success);

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

inline bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordTaskOutcome(std::string_view) {
}

inline void Metrics::AddTransferredBytes(std::uint64_t) {
}

inline void Metrics::ObserveTransferDurationMs(double) {
}

inline void Metrics::RecordCredentialRefresh(bool) {
}
#endif

} // namespace swarm::observability
