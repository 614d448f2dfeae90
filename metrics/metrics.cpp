#include "metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace infergate {

namespace {

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << hist.counts[i].load()
        << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << hist.sum_ms.load() << "\n";
  out << name << "_count " << hist.total.load() << "\n";
}

} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordServerStart(const std::string &backend,
                                        double startup_seconds) {
  server_starts_.fetch_add(1, std::memory_order_relaxed);
  startup_latency_.Record(startup_seconds * 1000.0);
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++starts_by_backend_[backend.empty() ? "unknown" : backend];
}

void MetricsRegistry::RecordServerStartFailure(const std::string &reason) {
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++start_failures_[reason];
}

void MetricsRegistry::RecordServerStop() {
  server_stops_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordServerEviction() {
  server_evictions_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordOrphanKill() {
  orphan_kills_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetRunningServers(int count) {
  running_servers_.store(count, std::memory_order_relaxed);
}

void MetricsRegistry::RecordProxyRequest(const std::string &operation,
                                         double latency_ms) {
  proxy_latency_.Record(latency_ms);
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++proxy_requests_[operation];
}

void MetricsRegistry::RecordProxyError(const std::string &operation) {
  std::lock_guard<std::mutex> lock(labelled_mutex_);
  ++proxy_errors_[operation];
}

void MetricsRegistry::RecordModelRequest(const std::string &model_id,
                                         int prompt_tokens,
                                         int completion_tokens) {
  std::lock_guard<std::mutex> lock(model_mutex_);
  auto &stats = model_stats_[model_id];
  ++stats.requests;
  stats.prompt_tokens += static_cast<uint64_t>(std::max(0, prompt_tokens));
  stats.completion_tokens +=
      static_cast<uint64_t>(std::max(0, completion_tokens));
}

MetricsRegistry::ModelSnapshot
MetricsRegistry::GetModelSnapshot(const std::string &model_id) const {
  std::lock_guard<std::mutex> lock(model_mutex_);
  auto it = model_stats_.find(model_id);
  if (it == model_stats_.end()) {
    return {};
  }
  return it->second;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  out << "# HELP infergate_server_starts_total Native servers started\n";
  out << "# TYPE infergate_server_starts_total counter\n";
  {
    std::lock_guard<std::mutex> lock(labelled_mutex_);
    for (const auto &[backend, count] : starts_by_backend_) {
      out << "infergate_server_starts_total{backend=\"" << backend << "\"} "
          << count << "\n";
    }
  }

  out << "# HELP infergate_server_start_failures_total Failed server starts\n";
  out << "# TYPE infergate_server_start_failures_total counter\n";
  {
    std::lock_guard<std::mutex> lock(labelled_mutex_);
    for (const auto &[reason, count] : start_failures_) {
      out << "infergate_server_start_failures_total{reason=\"" << reason
          << "\"} " << count << "\n";
    }
  }

  out << "# HELP infergate_server_stops_total Servers stopped on request\n";
  out << "# TYPE infergate_server_stops_total counter\n";
  out << "infergate_server_stops_total " << server_stops_.load() << "\n";

  out << "# HELP infergate_server_evictions_total Dead servers evicted after a "
         "failed health probe\n";
  out << "# TYPE infergate_server_evictions_total counter\n";
  out << "infergate_server_evictions_total " << server_evictions_.load()
      << "\n";

  out << "# HELP infergate_orphan_kills_total Orphaned server processes killed "
         "at start-up\n";
  out << "# TYPE infergate_orphan_kills_total counter\n";
  out << "infergate_orphan_kills_total " << orphan_kills_.load() << "\n";

  out << "# HELP infergate_running_servers Servers currently tracked\n";
  out << "# TYPE infergate_running_servers gauge\n";
  out << "infergate_running_servers " << running_servers_.load() << "\n";

  RenderHistogram(out, "infergate_server_startup_duration_ms",
                  "Time from spawn to first healthy probe", startup_latency_);

  out << "# HELP infergate_proxy_requests_total HTTP calls proxied to servers\n";
  out << "# TYPE infergate_proxy_requests_total counter\n";
  {
    std::lock_guard<std::mutex> lock(labelled_mutex_);
    for (const auto &[op, count] : proxy_requests_) {
      out << "infergate_proxy_requests_total{operation=\"" << op << "\"} "
          << count << "\n";
    }
  }

  out << "# HELP infergate_proxy_errors_total Proxied HTTP calls that failed\n";
  out << "# TYPE infergate_proxy_errors_total counter\n";
  {
    std::lock_guard<std::mutex> lock(labelled_mutex_);
    for (const auto &[op, count] : proxy_errors_) {
      out << "infergate_proxy_errors_total{operation=\"" << op << "\"} "
          << count << "\n";
    }
  }

  RenderHistogram(out, "infergate_proxy_duration_ms",
                  "Latency of proxied HTTP calls", proxy_latency_);

  out << "# HELP infergate_model_requests_total Requests served per model\n";
  out << "# TYPE infergate_model_requests_total counter\n";
  {
    std::lock_guard<std::mutex> lock(model_mutex_);
    for (const auto &[model, stats] : model_stats_) {
      out << "infergate_model_requests_total{model=\"" << model << "\"} "
          << stats.requests << "\n";
    }
  }

  out << "# HELP infergate_model_completion_tokens_total Completion tokens per "
         "model\n";
  out << "# TYPE infergate_model_completion_tokens_total counter\n";
  {
    std::lock_guard<std::mutex> lock(model_mutex_);
    for (const auto &[model, stats] : model_stats_) {
      out << "infergate_model_completion_tokens_total{model=\"" << model
          << "\"} " << stats.completion_tokens << "\n";
    }
  }

  return out.str();
}

} // namespace infergate
