#include "txledger/ledger/ledger_state.hpp"

#include <algorithm>

namespace txledger {
namespace ledger {

std::string_view to_string(Outcome outcome) noexcept {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kDuplicateTransaction:
      return "duplicate_transaction";
    case Outcome::kLockedAccount:
      return "locked_account";
    case Outcome::kInsufficientFunds:
      return "insufficient_funds";
    case Outcome::kUnknownTransaction:
      return "unknown_transaction";
    case Outcome::kInvalidStateTransition:
      return "invalid_state_transition";
    case Outcome::kBalanceOverflow:
      return "balance_overflow";
  }
  return "unknown";
}

std::string_view to_string(DisputeState state) noexcept {
  switch (state) {
    case DisputeState::kNormal:
      return "normal";
    case DisputeState::kDisputed:
      return "disputed";
    case DisputeState::kResolved:
      return "resolved";
    case DisputeState::kChargedBack:
      return "charged_back";
  }
  return "unknown";
}

LedgerState::LedgerState(std::size_t arena_bytes)
    : arena_(arena_bytes),
      accounts_(&arena_),
      deposits_(&arena_),
      claimed_ids_(&arena_) {}

Outcome LedgerState::apply(const common::TransactionRecord& record) {
  auto& account = ensure_account(record.client);

  switch (record.kind) {
    case common::RecordKind::kDeposit:
      return apply_deposit(account, record);
    case common::RecordKind::kWithdrawal:
      return apply_withdrawal(account, record);
    case common::RecordKind::kDispute:
      return apply_dispute(account, record);
    case common::RecordKind::kResolve:
      return apply_resolve(account, record);
    case common::RecordKind::kChargeback:
      return apply_chargeback(account, record);
  }
  return Outcome::kUnknownTransaction;
}

void LedgerState::open_account(common::ClientId client) {
  ensure_account(client);
}

std::vector<Account> LedgerState::finalize() const {
  std::vector<Account> out;
  out.reserve(accounts_.size());
  for (const auto& [client, state] : accounts_) {
    out.push_back(Account{
        .client = client,
        .available = state.available,
        .held = state.held,
        .locked = state.locked,
    });
  }
  std::sort(out.begin(), out.end(),
            [](const Account& lhs, const Account& rhs) { return lhs.client < rhs.client; });
  return out;
}

std::optional<Account> LedgerState::get(common::ClientId client) const {
  if (auto it = accounts_.find(client); it != accounts_.end()) {
    return Account{
        .client = client,
        .available = it->second.available,
        .held = it->second.held,
        .locked = it->second.locked,
    };
  }
  return std::nullopt;
}

std::optional<DisputeState> LedgerState::dispute_state(common::TxId tx) const {
  if (auto it = deposits_.find(tx); it != deposits_.end()) {
    return it->second.state;
  }
  return std::nullopt;
}

LedgerState::AccountState& LedgerState::ensure_account(common::ClientId client) {
  return accounts_.try_emplace(client, AccountState{}).first->second;
}

bool LedgerState::claim_id(common::TxId tx) {
  return claimed_ids_.insert(tx).second;
}

Outcome LedgerState::apply_deposit(AccountState& account, const common::TransactionRecord& record) {
  if (!claim_id(record.tx)) {
    return Outcome::kDuplicateTransaction;
  }
  if (account.locked) {
    return Outcome::kLockedAccount;
  }

  const auto available = account.available.checked_add(record.amount);
  if (!available || !available->checked_add(account.held)) {
    return Outcome::kBalanceOverflow;
  }

  account.available = *available;
  deposits_.try_emplace(record.tx, DepositEntry{
                                       .client = record.client,
                                       .amount = record.amount,
                                       .state = DisputeState::kNormal,
                                   });
  return Outcome::kApplied;
}

Outcome LedgerState::apply_withdrawal(AccountState& account, const common::TransactionRecord& record) {
  if (!claim_id(record.tx)) {
    return Outcome::kDuplicateTransaction;
  }
  if (account.locked) {
    return Outcome::kLockedAccount;
  }
  if (account.available < record.amount) {
    return Outcome::kInsufficientFunds;
  }

  account.available = account.available - record.amount;
  return Outcome::kApplied;
}

Outcome LedgerState::apply_dispute(AccountState& account, const common::TransactionRecord& record) {
  auto* deposit = find_deposit(record);
  if (!deposit) {
    return Outcome::kUnknownTransaction;
  }
  if (deposit->state != DisputeState::kNormal) {
    return Outcome::kInvalidStateTransition;
  }

  const auto available = account.available.checked_sub(deposit->amount);
  const auto held = account.held.checked_add(deposit->amount);
  if (!available || !held) {
    return Outcome::kBalanceOverflow;
  }

  account.available = *available;
  account.held = *held;
  deposit->state = DisputeState::kDisputed;
  return Outcome::kApplied;
}

Outcome LedgerState::apply_resolve(AccountState& account, const common::TransactionRecord& record) {
  auto* deposit = find_deposit(record);
  if (!deposit) {
    return Outcome::kUnknownTransaction;
  }
  if (deposit->state != DisputeState::kDisputed) {
    return Outcome::kInvalidStateTransition;
  }

  const auto held = account.held.checked_sub(deposit->amount);
  const auto available = account.available.checked_add(deposit->amount);
  if (!held || !available) {
    return Outcome::kBalanceOverflow;
  }

  account.held = *held;
  account.available = *available;
  deposit->state = DisputeState::kResolved;
  return Outcome::kApplied;
}

Outcome LedgerState::apply_chargeback(AccountState& account, const common::TransactionRecord& record) {
  auto* deposit = find_deposit(record);
  if (!deposit) {
    return Outcome::kUnknownTransaction;
  }
  if (deposit->state != DisputeState::kDisputed) {
    return Outcome::kInvalidStateTransition;
  }

  const auto held = account.held.checked_sub(deposit->amount);
  if (!held) {
    return Outcome::kBalanceOverflow;
  }

  account.held = *held;
  account.locked = true;
  deposit->state = DisputeState::kChargedBack;
  return Outcome::kApplied;
}

LedgerState::DepositEntry* LedgerState::find_deposit(const common::TransactionRecord& record) {
  auto it = deposits_.find(record.tx);
  if (it == deposits_.end() || it->second.client != record.client) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace ledger
}  // namespace txledger
