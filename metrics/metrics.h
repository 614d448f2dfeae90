#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace infergate {

// Fixed-bucket millisecond histogram rendered as Prometheus _bucket, _sum and
// _count series.
struct LatencyHistogram {
  // Upper bounds in milliseconds. Generation calls run for seconds, so the
  // buckets reach further than a typical request histogram.
  static constexpr std::array<double, 8> kBuckets{
      50.0, 250.0, 1000.0, 2500.0, 5000.0, 15000.0, 30000.0, 60000.0};
  std::array<std::atomic<uint64_t>, kBuckets.size() + 1> counts{}; // last is +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Process-local counters for the control plane itself. The native servers
// expose their own /metrics, which is proxied separately.
class MetricsRegistry {
public:
  // Server lifecycle.
  void RecordServerStart(const std::string &backend, double startup_seconds);
  void RecordServerStartFailure(const std::string &reason);
  void RecordServerStop();
  void RecordServerEviction();
  void RecordOrphanKill();
  void SetRunningServers(int count);

  // Proxied HTTP calls against running servers.
  void RecordProxyRequest(const std::string &operation, double latency_ms);
  void RecordProxyError(const std::string &operation);

  // Facade-level per-model accounting.
  void RecordModelRequest(const std::string &model_id, int prompt_tokens,
                          int completion_tokens);

  struct ModelSnapshot {
    uint64_t requests{0};
    uint64_t prompt_tokens{0};
    uint64_t completion_tokens{0};
  };
  ModelSnapshot GetModelSnapshot(const std::string &model_id) const;

  std::string RenderPrometheus() const;

private:
  std::atomic<uint64_t> server_starts_{0};
  std::atomic<uint64_t> server_stops_{0};
  std::atomic<uint64_t> server_evictions_{0};
  std::atomic<uint64_t> orphan_kills_{0};
  std::atomic<int> running_servers_{0};

  LatencyHistogram startup_latency_;
  LatencyHistogram proxy_latency_;

  mutable std::mutex labelled_mutex_;
  std::unordered_map<std::string, uint64_t> starts_by_backend_;
  std::unordered_map<std::string, uint64_t> start_failures_;
  std::unordered_map<std::string, uint64_t> proxy_requests_;
  std::unordered_map<std::string, uint64_t> proxy_errors_;

  mutable std::mutex model_mutex_;
  std::unordered_map<std::string, ModelSnapshot> model_stats_;
};

} // namespace infergate
