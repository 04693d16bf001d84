#include "common/assertions.hpp"
#include "service/metrics_collector.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using mediaprep::tests::common::Fail;

namespace service = mediaprep::service;
using mediaprep::core::errors::ErrorKind;
using namespace std::chrono_literals;

namespace {

std::uint64_t KindCount(const service::MetricsSnapshot& snapshot, ErrorKind kind) {
  return snapshot.failures_by_kind[static_cast<std::size_t>(mediaprep::core::errors::ToIndex(kind))];
}

const service::OperationMetrics* FindOperation(const service::MetricsSnapshot& snapshot,
                                               std::string_view name) {
  for (const auto& op : snapshot.operations) {
    if (op.name == name) {
      return &op;
    }
  }
  return nullptr;
}

} // namespace

int main() {
  // Empty collector.
  {
    service::MetricsCollector metrics;
    const service::MetricsSnapshot snapshot = metrics.Summary();
    if (snapshot.total_calls != 0U || snapshot.success_rate != 0.0 ||
        snapshot.latency.count != 0U) {
      Fail("expected an empty snapshot before any record");
    }
  }

  // S successes out of K calls.
  {
    service::MetricsCollector metrics;
    metrics.RegisterOperation("raw.preview");
    metrics.RegisterOperation("health");
    for (int i = 0; i < 7; ++i) {
      metrics.Record("raw.preview", true, std::chrono::milliseconds(10 + i));
    }
    metrics.Record("raw.preview", false, 40ms, ErrorKind::kNoUsablePreview);
    metrics.Record("raw.preview", false, 2ms, ErrorKind::kValidationError);
    metrics.Record("not.registered", false, 1ms, ErrorKind::kUnsupportedOperation);

    const service::MetricsSnapshot snapshot = metrics.Summary();
    if (snapshot.total_calls != 10U || snapshot.successes != 7U || snapshot.failures != 3U) {
      Fail("unexpected totals");
    }
    if (std::abs(snapshot.success_rate - 0.7) > 1e-9) {
      Fail("expected success_rate = 7/10, got " + std::to_string(snapshot.success_rate));
    }
    if (KindCount(snapshot, ErrorKind::kNoUsablePreview) != 1U ||
        KindCount(snapshot, ErrorKind::kValidationError) != 1U ||
        KindCount(snapshot, ErrorKind::kUnsupportedOperation) != 1U ||
        KindCount(snapshot, ErrorKind::kExternalToolFailure) != 0U) {
      Fail("unexpected failure categories");
    }

    const service::OperationMetrics* preview = FindOperation(snapshot, "raw.preview");
    const service::OperationMetrics* health = FindOperation(snapshot, "health");
    const service::OperationMetrics* unregistered =
        FindOperation(snapshot, service::kUnregisteredOperation);
    if (preview == nullptr || preview->calls != 9U || preview->failures != 2U) {
      Fail("unexpected raw.preview counters");
    }
    if (health == nullptr || health->calls != 0U) {
      Fail("expected registered-but-unused operation with zero calls");
    }
    if (unregistered == nullptr || unregistered->calls != 1U) {
      Fail("expected unknown names to aggregate under 'unregistered'");
    }

    const auto& latency = snapshot.latency;
    if (latency.count != 10U) {
      Fail("expected one latency sample per record");
    }
    if (!(latency.p50_ms <= latency.p95_ms && latency.p95_ms <= latency.p99_ms &&
          latency.p99_ms <= latency.max_ms)) {
      Fail("expected p50 <= p95 <= p99 <= max");
    }
    if (latency.max_ms < 40.0 || latency.p50_ms < 5.0) {
      Fail("percentiles are off by more than the bucket resolution");
    }
  }

  // Bucket layout is monotone.
  {
    std::size_t previous = 0;
    for (std::uint64_t micros : {0ULL, 1ULL, 10ULL, 1000ULL, 1000000ULL, 3600000000ULL}) {
      const std::size_t index = service::LatencyHistogram::BucketIndex(micros);
      if (index < previous || index >= service::LatencyHistogram::kBucketCount) {
        Fail("bucket index must be monotone and in range");
      }
      previous = index;
    }
  }

  // Concurrent writers lose nothing.
  {
    service::MetricsCollector metrics;
    metrics.RegisterOperation("image.preprocess");
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
      writers.emplace_back([&metrics, t] {
        for (int i = 0; i < kPerThread; ++i) {
          const bool ok = (i % 4) != 0;
          metrics.Record("image.preprocess", ok, std::chrono::microseconds(100 * (t + 1)),
                         ok ? std::nullopt : std::optional<ErrorKind>(ErrorKind::kProcessingError));
        }
      });
    }
    for (auto& writer : writers) {
      writer.join();
    }
    const service::MetricsSnapshot snapshot = metrics.Summary();
    if (snapshot.total_calls != static_cast<std::uint64_t>(kThreads * kPerThread)) {
      Fail("lost records under concurrency");
    }
    if (KindCount(snapshot, ErrorKind::kProcessingError) !=
        static_cast<std::uint64_t>(kThreads * kPerThread / 4)) {
      Fail("lost failure categories under concurrency");
    }
  }

  // Uptime comes from the injected clock.
  {
    auto now = std::chrono::steady_clock::time_point{} + 10s;
    service::MetricsCollector metrics([&now] { return now; });
    now += 1500ms;
    if (metrics.Summary().uptime_ms != 1500) {
      Fail("expected uptime from the injected clock");
    }
  }

  return 0;
}
