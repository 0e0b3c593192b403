#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "txledger/common/transaction.hpp"
#include "txledger/ledger/ledger_state.hpp"
#include "txledger/telemetry/telemetry_sink.hpp"

namespace txledger {
namespace replay {

// Pulls the next record into the argument; returns false at end of input.
using RecordSource = std::function<bool(common::TransactionRecord&)>;

struct RunStats {
  std::uint64_t records{0};
  std::array<std::uint64_t, ledger::kOutcomeCount> outcomes{};

  void add(ledger::Outcome outcome) noexcept;
  void merge(const RunStats& other) noexcept;
  [[nodiscard]] std::uint64_t count(ledger::Outcome outcome) const noexcept;
};

// Adds the record and per-outcome counts to the sink.
void publish(const RunStats& stats, telemetry::TelemetrySink& sink);

// Applies every record of a source, in order, to a single ledger.
class Driver {
 public:
  using OutcomeHandler = std::function<void(const common::TransactionRecord&, ledger::Outcome)>;

  Driver();

  void set_telemetry(telemetry::TelemetrySink* sink);
  // Called for every record the ledger did not apply.
  void set_outcome_handler(OutcomeHandler handler);
  RunStats execute(const RecordSource& source, ledger::LedgerState& state);

 private:
  telemetry::TelemetrySink* telemetry_{nullptr};
  OutcomeHandler outcome_handler_{};
};

// Splits the stream by client id across worker threads, each owning a private
// ledger. Records of one client always land on the same worker and keep their
// arrival order; workers share nothing while running.
class PartitionedDriver {
 public:
  struct Config {
    std::size_t workers{4};
    std::size_t queue_depth{1 << 12};
    std::size_t arena_bytes{1 << 20};
  };

  explicit PartitionedDriver(Config config);
  PartitionedDriver(const PartitionedDriver&) = delete;
  PartitionedDriver& operator=(const PartitionedDriver&) = delete;
  ~PartitionedDriver();

  void set_telemetry(telemetry::TelemetrySink* sink);
  // Called after a successful run for every record no partition applied, in
  // the order the source produced them.
  void set_outcome_handler(Driver::OutcomeHandler handler);

  // Runs the source to completion. Rethrows the first error raised by the
  // source or by a worker once every worker has stopped.
  RunStats execute(const RecordSource& source);

  // Merged accounts of all partitions, ascending client id.
  [[nodiscard]] std::vector<ledger::Account> accounts() const;

 private:
  struct Partition;

  Config config_;
  telemetry::TelemetrySink* telemetry_{nullptr};
  Driver::OutcomeHandler outcome_handler_{};
  std::vector<std::unique_ptr<Partition>> partitions_;
};

}  // namespace replay
}  // namespace txledger
