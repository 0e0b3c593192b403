#include "txledger/replay/replay_driver.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include "txledger/common/spsc_ring.hpp"
#include "txledger/common/time_utils.hpp"

namespace txledger {
namespace replay {

struct PartitionedDriver::Partition {
  struct Item {
    common::TransactionRecord record{};
    // Deposit/withdrawal whose id another partition already claimed.
    bool duplicate{false};
    std::uint64_t sequence{0};
  };

  struct Rejection {
    std::uint64_t sequence{0};
    common::TransactionRecord record{};
    ledger::Outcome outcome{ledger::Outcome::kApplied};
  };

  Partition(std::size_t queue_depth, std::size_t arena_bytes)
      : queue(queue_depth), ledger_state(arena_bytes) {}

  common::SpscRing<Item> queue;
  ledger::LedgerState ledger_state;
  RunStats stats{};
  telemetry::StreamingHistogram latency{};
  std::vector<Rejection> rejections{};
  std::exception_ptr error{};
  std::atomic<bool> failed{false};

  void run(bool timed, bool keep_rejections) {
    try {
      Item item;
      while (true) {
        if (!queue.pop(item)) {
          if (!queue.closed()) {
            std::this_thread::yield();
            continue;
          }
          // Everything pushed before close() is visible now.
          if (!queue.pop(item)) {
            break;
          }
        }
        consume(item, timed, keep_rejections);
      }
    } catch (...) {
      error = std::current_exception();
      failed.store(true, std::memory_order_release);
    }
  }

  void consume(const Item& item, bool timed, bool keep_rejections) {
    ledger::Outcome outcome{ledger::Outcome::kDuplicateTransaction};
    if (item.duplicate) {
      ledger_state.open_account(item.record.client);
    } else if (timed) {
      latency.record(common::time_steady([&] { outcome = ledger_state.apply(item.record); }).count());
    } else {
      outcome = ledger_state.apply(item.record);
    }

    stats.add(outcome);
    if (keep_rejections && outcome != ledger::Outcome::kApplied) {
      rejections.push_back(Rejection{.sequence = item.sequence, .record = item.record, .outcome = outcome});
    }
  }
};

PartitionedDriver::PartitionedDriver(Config config) : config_(config) {
  if (config_.workers == 0) {
    throw std::invalid_argument("partitioned driver needs at least one worker");
  }
}

PartitionedDriver::~PartitionedDriver() = default;

void PartitionedDriver::set_telemetry(telemetry::TelemetrySink* sink) {
  telemetry_ = sink;
}

void PartitionedDriver::set_outcome_handler(Driver::OutcomeHandler handler) {
  outcome_handler_ = std::move(handler);
}

RunStats PartitionedDriver::execute(const RecordSource& source) {
  partitions_.clear();
  for (std::size_t i = 0; i < config_.workers; ++i) {
    partitions_.push_back(std::make_unique<Partition>(config_.queue_depth, config_.arena_bytes));
  }

  const bool timed = telemetry_ != nullptr;
  const bool keep_rejections = static_cast<bool>(outcome_handler_);

  // Deposit/withdrawal ids are unique across the whole stream, so the
  // dispatcher, which sees every record in order, owns that check.
  auto dispatch = [&] {
    std::unordered_set<common::TxId> claimed_ids;
    common::TransactionRecord record;
    std::uint64_t sequence = 0;
    while (source(record)) {
      auto& partition = *partitions_[record.client % partitions_.size()];
      Partition::Item item{.record = record, .duplicate = false, .sequence = sequence++};
      if (common::carries_amount(record.kind)) {
        item.duplicate = !claimed_ids.insert(record.tx).second;
      }
      while (!partition.queue.push(item)) {
        if (partition.failed.load(std::memory_order_acquire)) {
          return;
        }
        std::this_thread::yield();
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(partitions_.size());
  std::exception_ptr dispatch_error;
  try {
    for (auto& partition : partitions_) {
      workers.emplace_back([&p = *partition, timed, keep_rejections] { p.run(timed, keep_rejections); });
    }
    dispatch();
  } catch (...) {
    dispatch_error = std::current_exception();
  }

  for (auto& partition : partitions_) {
    partition->queue.close();
  }
  for (auto& worker : workers) {
    worker.join();
  }

  if (dispatch_error) {
    std::rethrow_exception(dispatch_error);
  }

  RunStats total;
  for (const auto& partition : partitions_) {
    if (partition->error) {
      std::rethrow_exception(partition->error);
    }
    total.merge(partition->stats);
  }

  if (telemetry_) {
    publish(total, *telemetry_);
    for (const auto& partition : partitions_) {
      telemetry_->merge_latency(telemetry::Metric::kApplyLatency, partition->latency);
    }
  }

  if (outcome_handler_) {
    std::vector<Partition::Rejection> rejections;
    for (auto& partition : partitions_) {
      rejections.insert(rejections.end(), partition->rejections.begin(), partition->rejections.end());
      partition->rejections.clear();
    }
    std::sort(rejections.begin(), rejections.end(),
              [](const Partition::Rejection& lhs, const Partition::Rejection& rhs) {
                return lhs.sequence < rhs.sequence;
              });
    for (const auto& rejection : rejections) {
      outcome_handler_(rejection.record, rejection.outcome);
    }
  }
  return total;
}

std::vector<ledger::Account> PartitionedDriver::accounts() const {
  std::vector<ledger::Account> merged;
  for (const auto& partition : partitions_) {
    const auto partial = partition->ledger_state.finalize();
    merged.insert(merged.end(), partial.begin(), partial.end());
  }
  std::sort(merged.begin(), merged.end(),
            [](const ledger::Account& lhs, const ledger::Account& rhs) { return lhs.client < rhs.client; });
  return merged;
}

}  // namespace replay
}  // namespace txledger
