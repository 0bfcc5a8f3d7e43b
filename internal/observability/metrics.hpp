#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace aegis::config::v1 {
class RuntimeConfig;
}

namespace aegis::observability {

// Starts the OTLP exporter when observability.metrics_enabled; false otherwise.
bool InitializeMetrics(const aegis::config::v1::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Pipeline instruments.

  Exported over OTLP when built with ENABLE_OTEL, no-ops otherwise.
  PipelineStats (internal/pipeline/pipeline_stats.hpp) keeps the in-process
  counters regardless. Attribute values must outlive the call; callers pass
  the static names from AdmissionName, OutcomeName and ErrorCodeName.
*/
class Metrics {
 public:
  static Metrics& Instance();

  // decision: admitted, already_processed, in_flight, deferred, unreadable, rejected
  void RecordAdmission(std::string_view source, std::string_view decision);

  // outcome: committed, failed, backup_failed, superseded
  void RecordOutcome(std::string_view outcome, std::string_view reason_code);
  void ObserveRunDurationMs(std::string_view outcome, double duration_ms);

  // result: finished, cancelled
  void RecordScan(std::string_view result, std::uint64_t visited, std::uint64_t admitted);
  void RecordWatchOverflow();

  void SetQueueDepth(std::uint64_t depth);
  void SetInFlight(std::uint64_t in_flight);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const aegis::config::v1::RuntimeConfig&) {
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

inline void Metrics::RecordAdmission(std::string_view, std::string_view) {
}

inline void Metrics::RecordOutcome(std::string_view, std::string_view) {
}

inline void Metrics::ObserveRunDurationMs(std::string_view, double) {
}

inline void Metrics::RecordScan(std::string_view, std::uint64_t, std::uint64_t) {
}

inline void Metrics::RecordWatchOverflow() {
}

inline void Metrics::SetQueueDepth(std::uint64_t) {
}

inline void Metrics::SetInFlight(std::uint64_t) {
}
#endif

} // namespace aegis::observability
