#pragma once

#include "core/errors/error_kind.hpp"
#include "core/json_dom.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::service {

inline constexpr std::string_view kUnregisteredOperation = "unregistered";

// Bounded-memory latency estimator. Samples land in log-spaced buckets
// (four per power of two of microseconds), so percentiles are accurate to
// about 19% and never need the raw samples.
class LatencyHistogram {
public:
  static constexpr std::size_t kBucketCount = 136;

  void Record(std::chrono::nanoseconds latency);

  struct Summary {
    std::uint64_t count = 0;
    double mean_ms = 0.0;
    double max_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
  };

  // Percentiles are read from one copy of the buckets, so p50 <= p95 <= p99
  // holds even while writers are active.
  Summary Summarize() const;

  static std::size_t BucketIndex(std::uint64_t micros);
  static double BucketUpperBoundMicros(std::size_t index);

private:
  std::array<std::atomic<std::uint64_t>, kBucketCount> buckets_{};
  std::atomic<std::uint64_t> total_micros_{0};
  std::atomic<std::uint64_t> max_micros_{0};
};

struct OperationMetrics {
  std::string name;
  std::uint64_t calls = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  LatencyHistogram::Summary latency;
};

// Point-in-time copy of the counters. Values only grow for the life of the
// collector.
struct MetricsSnapshot {
  std::uint64_t total_calls = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  // successes / total_calls, 0 when nothing was recorded.
  double success_rate = 0.0;
  std::array<std::uint64_t, core::errors::kErrorKindCount> failures_by_kind{};
  LatencyHistogram::Summary latency;
  std::vector<OperationMetrics> operations;
  std::int64_t uptime_ms = 0;
};

// Process-wide request accounting, owned by whoever owns the router and
// passed to it by reference.
//
// Record() only touches atomics, so concurrent requests never serialize on a
// lock. The per-operation table is fixed at registration time: call
// RegisterOperation() before the first Record(); names that were never
// registered are counted under `unregistered`.
class MetricsCollector {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  MetricsCollector();
  // Clock seam for uptime tests.
  explicit MetricsCollector(Clock clock);

  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Not thread-safe with Record(); startup only. Re-registering is a no-op.
  void RegisterOperation(std::string_view name);

  void Record(std::string_view operation, bool ok, std::chrono::nanoseconds latency,
              std::optional<core::errors::ErrorKind> failure = std::nullopt);

  MetricsSnapshot Summary() const;

private:
  struct Counters {
    std::atomic<std::uint64_t> successes{0};
    std::atomic<std::uint64_t> failures{0};
    LatencyHistogram latency;
  };

  Counters& SlotFor(std::string_view operation);

  Clock clock_;
  std::chrono::steady_clock::time_point started_at_;

  Counters totals_;
  std::array<std::atomic<std::uint64_t>, core::errors::kErrorKindCount> failures_by_kind_{};
  std::map<std::string, std::unique_ptr<Counters>, std::less<>> operations_;
  Counters unregistered_;
};

// JSON rendering used by the `media.metrics` operation.
core::json::Value MetricsSnapshotToJson(const MetricsSnapshot& snapshot);

} // namespace mediaprep::service
