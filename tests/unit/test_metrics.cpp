#include <catch2/catch.hpp>

#include "metrics/metrics.h"

#include <string>

using namespace infergate;

namespace {

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("MetricsRegistry renders zeroed counters", "[metrics]") {
  MetricsRegistry registry;
  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "infergate_server_stops_total 0"));
  REQUIRE(Contains(output, "infergate_orphan_kills_total 0"));
  REQUIRE(Contains(output, "infergate_running_servers 0"));
  REQUIRE(Contains(output, "# TYPE infergate_proxy_duration_ms histogram"));
}

TEST_CASE("MetricsRegistry labels server starts by backend", "[metrics]") {
  MetricsRegistry registry;
  registry.RecordServerStart("vulkan", 1.2);
  registry.RecordServerStart("vulkan", 0.3);
  registry.RecordServerStart("", 0.1);
  registry.RecordServerStartFailure("startup_timeout");

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "infergate_server_starts_total{backend=\"vulkan\"} 2"));
  REQUIRE(Contains(output, "infergate_server_starts_total{backend=\"unknown\"} 1"));
  REQUIRE(Contains(
      output, "infergate_server_start_failures_total{reason=\"startup_timeout\"} 1"));
  REQUIRE(Contains(output, "infergate_server_startup_duration_ms_count 3"));
}

TEST_CASE("MetricsRegistry histogram buckets are cumulative", "[metrics]") {
  MetricsRegistry registry;
  registry.RecordProxyRequest("chat", 10.0);
  registry.RecordProxyRequest("chat", 2000.0);
  registry.RecordProxyError("chat");

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "infergate_proxy_duration_ms_bucket{le=\"50\"} 1"));
  REQUIRE(Contains(output, "infergate_proxy_duration_ms_bucket{le=\"2500\"} 2"));
  REQUIRE(Contains(output, "infergate_proxy_duration_ms_bucket{le=\"+Inf\"} 2"));
  REQUIRE(Contains(output, "infergate_proxy_duration_ms_sum 2010"));
  REQUIRE(Contains(output, "infergate_proxy_requests_total{operation=\"chat\"} 2"));
  REQUIRE(Contains(output, "infergate_proxy_errors_total{operation=\"chat\"} 1"));
}

TEST_CASE("MetricsRegistry tracks lifecycle counters", "[metrics]") {
  MetricsRegistry registry;
  registry.RecordServerStop();
  registry.RecordServerEviction();
  registry.RecordOrphanKill();
  registry.RecordOrphanKill();
  registry.SetRunningServers(3);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "infergate_server_stops_total 1"));
  REQUIRE(Contains(output, "infergate_server_evictions_total 1"));
  REQUIRE(Contains(output, "infergate_orphan_kills_total 2"));
  REQUIRE(Contains(output, "infergate_running_servers 3"));
}

TEST_CASE("MetricsRegistry accumulates per-model tokens", "[metrics]") {
  MetricsRegistry registry;
  registry.RecordModelRequest("llama3", 10, 20);
  registry.RecordModelRequest("llama3", 5, 15);
  registry.RecordModelRequest("llama3", -1, -1);

  auto snapshot = registry.GetModelSnapshot("llama3");
  REQUIRE(snapshot.requests == 3);
  REQUIRE(snapshot.prompt_tokens == 15);
  REQUIRE(snapshot.completion_tokens == 35);
  REQUIRE(registry.GetModelSnapshot("other").requests == 0);

  auto output = registry.RenderPrometheus();
  REQUIRE(Contains(output, "infergate_model_requests_total{model=\"llama3\"} 3"));
  REQUIRE(Contains(
      output, "infergate_model_completion_tokens_total{model=\"llama3\"} 35"));
}
