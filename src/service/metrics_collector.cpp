#include "service/metrics_collector.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace mediaprep::service {

namespace {

constexpr double kBucketsPerOctave = 4.0;

std::uint64_t ToMicros(std::chrono::nanoseconds latency) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(latency).count();
  return micros < 0 ? 0U : static_cast<std::uint64_t>(micros);
}

void UpdateMax(std::atomic<std::uint64_t>& target, std::uint64_t value) {
  std::uint64_t current = target.load(std::memory_order_relaxed);
  while (value > current &&
         !target.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
  }
}

core::json::Value LatencyToJson(const LatencyHistogram::Summary& latency) {
  core::json::Value out = core::json::MakeObject();
  out.Set("count", core::json::MakeNumber(static_cast<double>(latency.count)));
  out.Set("mean_ms", core::json::MakeNumber(latency.mean_ms));
  out.Set("max_ms", core::json::MakeNumber(latency.max_ms));
  out.Set("p50_ms", core::json::MakeNumber(latency.p50_ms));
  out.Set("p95_ms", core::json::MakeNumber(latency.p95_ms));
  out.Set("p99_ms", core::json::MakeNumber(latency.p99_ms));
  return out;
}

} // namespace

std::size_t LatencyHistogram::BucketIndex(std::uint64_t micros) {
  const double scaled =
      std::floor(kBucketsPerOctave * std::log2(static_cast<double>(micros) + 1.0));
  const auto index = static_cast<std::size_t>(std::max(0.0, scaled));
  return std::min(index, kBucketCount - 1U);
}

double LatencyHistogram::BucketUpperBoundMicros(std::size_t index) {
  return std::exp2(static_cast<double>(index + 1U) / kBucketsPerOctave) - 1.0;
}

void LatencyHistogram::Record(std::chrono::nanoseconds latency) {
  const std::uint64_t micros = ToMicros(latency);
  buckets_[BucketIndex(micros)].fetch_add(1U, std::memory_order_relaxed);
  total_micros_.fetch_add(micros, std::memory_order_relaxed);
  UpdateMax(max_micros_, micros);
}

LatencyHistogram::Summary LatencyHistogram::Summarize() const {
  std::array<std::uint64_t, kBucketCount> counts{};
  std::uint64_t total = 0;
  for (std::size_t i = 0; i < kBucketCount; ++i) {
    counts[i] = buckets_[i].load(std::memory_order_relaxed);
    total += counts[i];
  }

  Summary summary;
  summary.count = total;
  if (total == 0U) {
    return summary;
  }

  const double max_micros = static_cast<double>(max_micros_.load(std::memory_order_relaxed));
  summary.max_ms = max_micros / 1000.0;
  summary.mean_ms = static_cast<double>(total_micros_.load(std::memory_order_relaxed)) /
                    static_cast<double>(total) / 1000.0;

  // Nearest-rank over the copied buckets; the bucket bound is clamped to the
  // largest value seen so a single sample reports itself, not its bucket edge.
  const auto percentile = [&counts, total, max_micros](double quantile) {
    const auto rank = static_cast<std::uint64_t>(
        std::max(1.0, std::ceil(quantile * static_cast<double>(total))));
    std::uint64_t cumulative = 0;
    for (std::size_t i = 0; i < kBucketCount; ++i) {
      cumulative += counts[i];
      if (cumulative >= rank) {
        return std::min(BucketUpperBoundMicros(i), max_micros) / 1000.0;
      }
    }
    return max_micros / 1000.0;
  };

  summary.p50_ms = percentile(0.50);
  summary.p95_ms = percentile(0.95);
  summary.p99_ms = percentile(0.99);
  return summary;
}

MetricsCollector::MetricsCollector()
    : MetricsCollector([] { return std::chrono::steady_clock::now(); }) {}

MetricsCollector::MetricsCollector(Clock clock)
    : clock_(std::move(clock)), started_at_(clock_()) {}

void MetricsCollector::RegisterOperation(std::string_view name) {
  if (operations_.find(name) != operations_.end()) {
    return;
  }
  operations_.emplace(std::string(name), std::make_unique<Counters>());
}

MetricsCollector::Counters& MetricsCollector::SlotFor(std::string_view operation) {
  const auto it = operations_.find(operation);
  return it == operations_.end() ? unregistered_ : *it->second;
}

void MetricsCollector::Record(std::string_view operation, bool ok,
                              std::chrono::nanoseconds latency,
                              std::optional<core::errors::ErrorKind> failure) {
  Counters& slot = SlotFor(operation);
  if (ok) {
    totals_.successes.fetch_add(1U, std::memory_order_relaxed);
    slot.successes.fetch_add(1U, std::memory_order_relaxed);
  } else {
    totals_.failures.fetch_add(1U, std::memory_order_relaxed);
    slot.failures.fetch_add(1U, std::memory_order_relaxed);
    const core::errors::ErrorKind kind =
        failure.value_or(core::errors::ErrorKind::kProcessingError);
    failures_by_kind_[static_cast<std::size_t>(core::errors::ToIndex(kind))].fetch_add(
        1U, std::memory_order_relaxed);
  }
  totals_.latency.Record(latency);
  slot.latency.Record(latency);
}

MetricsSnapshot MetricsCollector::Summary() const {
  MetricsSnapshot snapshot;
  snapshot.successes = totals_.successes.load(std::memory_order_relaxed);
  snapshot.failures = totals_.failures.load(std::memory_order_relaxed);
  snapshot.total_calls = snapshot.successes + snapshot.failures;
  snapshot.success_rate =
      snapshot.total_calls == 0U
          ? 0.0
          : static_cast<double>(snapshot.successes) / static_cast<double>(snapshot.total_calls);

  for (std::size_t i = 0; i < failures_by_kind_.size(); ++i) {
    snapshot.failures_by_kind[i] = failures_by_kind_[i].load(std::memory_order_relaxed);
  }
  snapshot.latency = totals_.latency.Summarize();

  const auto add_operation = [&snapshot](std::string_view name, const Counters& counters) {
    OperationMetrics metrics;
    metrics.name = std::string(name);
    metrics.successes = counters.successes.load(std::memory_order_relaxed);
    metrics.failures = counters.failures.load(std::memory_order_relaxed);
    metrics.calls = metrics.successes + metrics.failures;
    metrics.latency = counters.latency.Summarize();
    snapshot.operations.push_back(std::move(metrics));
  };
  for (const auto& [name, counters] : operations_) {
    add_operation(name, *counters);
  }
  add_operation(kUnregisteredOperation, unregistered_);

  snapshot.uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           clock_() - started_at_)
                           .count();
  return snapshot;
}

core::json::Value MetricsSnapshotToJson(const MetricsSnapshot& snapshot) {
  using core::json::MakeNumber;

  core::json::Value out = core::json::MakeObject();
  out.Set("total_calls", MakeNumber(static_cast<double>(snapshot.total_calls)));
  out.Set("successes", MakeNumber(static_cast<double>(snapshot.successes)));
  out.Set("failures", MakeNumber(static_cast<double>(snapshot.failures)));
  out.Set("success_rate", MakeNumber(snapshot.success_rate));
  out.Set("uptime_ms", MakeNumber(static_cast<double>(snapshot.uptime_ms)));
  out.Set("latency", LatencyToJson(snapshot.latency));

  core::json::Value by_kind = core::json::MakeObject();
  for (int i = 0; i < core::errors::kErrorKindCount; ++i) {
    const auto kind = static_cast<core::errors::ErrorKind>(i);
    by_kind.Set(std::string(core::errors::ToString(kind)),
                MakeNumber(static_cast<double>(snapshot.failures_by_kind[static_cast<std::size_t>(i)])));
  }
  out.Set("failures_by_kind", std::move(by_kind));

  core::json::Value operations = core::json::MakeObject();
  for (const OperationMetrics& op : snapshot.operations) {
    core::json::Value entry = core::json::MakeObject();
    entry.Set("calls", MakeNumber(static_cast<double>(op.calls)));
    entry.Set("successes", MakeNumber(static_cast<double>(op.successes)));
    entry.Set("failures", MakeNumber(static_cast<double>(op.failures)));
    entry.Set("latency", LatencyToJson(op.latency));
    operations.Set(op.name, std::move(entry));
  }
  out.Set("operations", std::move(operations));
  return out;
}

} // namespace mediaprep::service
