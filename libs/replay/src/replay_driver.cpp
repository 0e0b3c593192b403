#include "txledger/replay/replay_driver.hpp"

#include <utility>

#include "txledger/common/time_utils.hpp"

namespace txledger {
namespace replay {

namespace {

telemetry::Metric metric_for(ledger::Outcome outcome) noexcept {
  switch (outcome) {
    case ledger::Outcome::kApplied:
      return telemetry::Metric::kApplied;
    case ledger::Outcome::kDuplicateTransaction:
      return telemetry::Metric::kDuplicateTransaction;
    case ledger::Outcome::kLockedAccount:
      return telemetry::Metric::kLockedAccount;
    case ledger::Outcome::kInsufficientFunds:
      return telemetry::Metric::kInsufficientFunds;
    case ledger::Outcome::kUnknownTransaction:
      return telemetry::Metric::kUnknownTransaction;
    case ledger::Outcome::kInvalidStateTransition:
      return telemetry::Metric::kInvalidStateTransition;
    case ledger::Outcome::kBalanceOverflow:
      return telemetry::Metric::kBalanceOverflow;
  }
  return telemetry::Metric::kApplied;
}

}  // namespace

void RunStats::add(ledger::Outcome outcome) noexcept {
  ++records;
  ++outcomes[static_cast<std::size_t>(outcome)];
}

void RunStats::merge(const RunStats& other) noexcept {
  records += other.records;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    outcomes[i] += other.outcomes[i];
  }
}

std::uint64_t RunStats::count(ledger::Outcome outcome) const noexcept {
  return outcomes[static_cast<std::size_t>(outcome)];
}

void publish(const RunStats& stats, telemetry::TelemetrySink& sink) {
  sink.increment(telemetry::Metric::kRecordsRead, static_cast<std::int64_t>(stats.records));
  for (std::size_t i = 0; i < stats.outcomes.size(); ++i) {
    if (stats.outcomes[i] != 0) {
      sink.increment(metric_for(static_cast<ledger::Outcome>(i)), static_cast<std::int64_t>(stats.outcomes[i]));
    }
  }
}

Driver::Driver() = default;

void Driver::set_telemetry(telemetry::TelemetrySink* sink) {
  telemetry_ = sink;
}

void Driver::set_outcome_handler(OutcomeHandler handler) {
  outcome_handler_ = std::move(handler);
}

RunStats Driver::execute(const RecordSource& source, ledger::LedgerState& state) {
  RunStats stats;
  telemetry::StreamingHistogram latency;
  common::TransactionRecord record;

  while (source(record)) {
    ledger::Outcome outcome{ledger::Outcome::kApplied};
    if (telemetry_) {
      latency.record(common::time_steady([&] { outcome = state.apply(record); }).count());
    } else {
      outcome = state.apply(record);
    }

    stats.add(outcome);
    if (outcome != ledger::Outcome::kApplied && outcome_handler_) {
      outcome_handler_(record, outcome);
    }
  }

  if (telemetry_) {
    publish(stats, *telemetry_);
    telemetry_->merge_latency(telemetry::Metric::kApplyLatency, latency);
  }
  return stats;
}

}  // namespace replay
}  // namespace txledger
