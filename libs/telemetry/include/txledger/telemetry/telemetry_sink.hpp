#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <mutex>
#include <string_view>
#include <vector>

namespace txledger {
namespace telemetry {

enum class Metric : std::uint16_t {
  kRecordsRead,
  kMalformedRecords,
  kApplied,
  kDuplicateTransaction,
  kLockedAccount,
  kInsufficientFunds,
  kUnknownTransaction,
  kInvalidStateTransition,
  kBalanceOverflow,
  kApplyLatency,
};

inline constexpr std::size_t kMetricCount = 10;

std::string_view to_string(Metric metric) noexcept;

// Streaming histogram with O(1) recording and O(bucket_count) percentile computation.
// Uses log2-scale buckets from 1ns to ~1s (30 buckets).
class StreamingHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;
  void merge(const StreamingHistogram& other) noexcept;
  void reset() noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t min_{std::numeric_limits<std::int64_t>::max()};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

// Process-wide counters and latency histograms. Safe to share between
// threads; hot loops should tally locally and publish in bulk.
class TelemetrySink {
 public:
  struct Counter {
    Metric metric{Metric::kRecordsRead};
    std::int64_t value{0};
  };

  struct Summary {
    Metric metric{Metric::kApplyLatency};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p50_ns{0.0};
    double p99_ns{0.0};
    std::int64_t max_ns{0};
  };

  void increment(Metric metric, std::int64_t delta = 1);
  void merge_latency(Metric metric, const StreamingHistogram& histogram);

  [[nodiscard]] std::int64_t counter(Metric metric) const;
  // Non-zero counters in Metric order.
  [[nodiscard]] std::vector<Counter> counters() const;
  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::array<std::int64_t, kMetricCount> counters_{};
  std::array<StreamingHistogram, kMetricCount> histograms_{};
};

}  // namespace telemetry
}  // namespace txledger
