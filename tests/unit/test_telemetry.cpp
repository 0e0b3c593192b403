#include "test_telemetry.hpp"

#include <cassert>
#include <thread>
#include <vector>

#include "txledger/telemetry/telemetry_sink.hpp"

namespace txledger::tests {

void test_streaming_histogram() {
  telemetry::StreamingHistogram hist;
  assert(hist.count() == 0);
  assert(hist.mean() == 0.0);
  assert(hist.percentile(0.5) == 0.0);

  for (int i = 0; i < 99; ++i) {
    hist.record(100);
  }
  hist.record(1'000'000);

  assert(hist.count() == 100);
  assert(hist.max() == 1'000'000);
  // 100 lands in [64, 128), reported at its midpoint.
  assert(hist.percentile(0.50) == 96.0);
  assert(hist.percentile(1.0) == 786'432.0);

  telemetry::StreamingHistogram other;
  other.record(1);
  hist.merge(other);
  assert(hist.count() == 101);

  hist.reset();
  assert(hist.count() == 0);
  assert(hist.max() == 0);
}

void test_telemetry_sink() {
  telemetry::TelemetrySink sink;
  assert(sink.counters().empty());

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&sink] {
      for (int i = 0; i < 1000; ++i) {
        sink.increment(telemetry::Metric::kApplied);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  sink.increment(telemetry::Metric::kMalformedRecords, 3);

  assert(sink.counter(telemetry::Metric::kApplied) == 4000);
  const auto counters = sink.counters();
  assert(counters.size() == 2);
  assert(counters[0].metric == telemetry::Metric::kMalformedRecords);
  assert(counters[1].metric == telemetry::Metric::kApplied);
  assert(telemetry::to_string(counters[1].metric) == "applied");

  telemetry::StreamingHistogram first;
  first.record(500);
  telemetry::StreamingHistogram second;
  second.record(700);
  sink.merge_latency(telemetry::Metric::kApplyLatency, first);
  sink.merge_latency(telemetry::Metric::kApplyLatency, second);
  const auto summaries = sink.drain_latency();
  assert(summaries.size() == 1);
  assert(summaries[0].count == 2);
  assert(summaries[0].mean_ns == 600.0);
  assert(summaries[0].max_ns == 700);
  assert(sink.drain_latency().empty());
}

}  // namespace txledger::tests
