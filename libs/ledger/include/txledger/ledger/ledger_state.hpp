#pragma once

#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "txledger/common/amount.hpp"
#include "txledger/common/transaction.hpp"
#include "txledger/common/types.hpp"

namespace txledger {
namespace ledger {

enum class DisputeState : std::uint8_t {
  kNormal,
  kDisputed,
  kResolved,     // terminal
  kChargedBack,  // terminal
};

enum class Outcome : std::uint8_t {
  kApplied,
  kDuplicateTransaction,
  kLockedAccount,
  kInsufficientFunds,
  kUnknownTransaction,
  kInvalidStateTransition,
  kBalanceOverflow,
};

inline constexpr std::size_t kOutcomeCount = 7;

std::string_view to_string(Outcome outcome) noexcept;
std::string_view to_string(DisputeState state) noexcept;

struct Account {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  bool locked{false};

  [[nodiscard]] common::Amount total() const noexcept { return available + held; }

  bool operator==(const Account&) const = default;
};

// Folds transaction records into per-client account state.
//
// Every record either applies completely or leaves the ledger as it was (the
// referenced account is still created if it did not exist). apply() never
// throws for a well-formed record; rejected records are reported through the
// returned Outcome only.
class LedgerState {
 public:
  explicit LedgerState(std::size_t arena_bytes = 1 << 20);
  LedgerState(const LedgerState&) = delete;
  LedgerState& operator=(const LedgerState&) = delete;

  Outcome apply(const common::TransactionRecord& record);

  // Creates a zeroed account for client if none exists yet.
  void open_account(common::ClientId client);

  // All accounts ordered by ascending client id.
  [[nodiscard]] std::vector<Account> finalize() const;

  [[nodiscard]] std::optional<Account> get(common::ClientId client) const;
  [[nodiscard]] std::optional<DisputeState> dispute_state(common::TxId tx) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }

 private:
  struct AccountState {
    common::Amount available{};
    common::Amount held{};
    bool locked{false};
  };

  struct DepositEntry {
    common::ClientId client{0};
    common::Amount amount{};
    DisputeState state{DisputeState::kNormal};
  };

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_map<common::ClientId, AccountState> accounts_;
  std::pmr::unordered_map<common::TxId, DepositEntry> deposits_;
  // Every deposit/withdrawal id seen so far, applied or not.
  std::pmr::unordered_set<common::TxId> claimed_ids_;

  AccountState& ensure_account(common::ClientId client);
  bool claim_id(common::TxId tx);

  Outcome apply_deposit(AccountState& account, const common::TransactionRecord& record);
  Outcome apply_withdrawal(AccountState& account, const common::TransactionRecord& record);
  Outcome apply_dispute(AccountState& account, const common::TransactionRecord& record);
  Outcome apply_resolve(AccountState& account, const common::TransactionRecord& record);
  Outcome apply_chargeback(AccountState& account, const common::TransactionRecord& record);

  // Deposit named by a dispute-family record, or nullptr when it does not
  // exist or belongs to another client.
  DepositEntry* find_deposit(const common::TransactionRecord& record);
};

}  // namespace ledger
}  // namespace txledger
