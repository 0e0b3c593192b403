#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "txledger/common/amount.hpp"
#include "txledger/common/types.hpp"

namespace txledger {
namespace common {

enum class RecordKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

// Only deposits and withdrawals move funds in; the other kinds reference an
// earlier deposit by id.
inline constexpr bool carries_amount(RecordKind kind) noexcept {
  return kind == RecordKind::kDeposit || kind == RecordKind::kWithdrawal;
}

inline constexpr std::string_view to_string(RecordKind kind) noexcept {
  switch (kind) {
    case RecordKind::kDeposit:
      return "deposit";
    case RecordKind::kWithdrawal:
      return "withdrawal";
    case RecordKind::kDispute:
      return "dispute";
    case RecordKind::kResolve:
      return "resolve";
    case RecordKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

// Case-sensitive; callers normalize the text first.
inline constexpr std::optional<RecordKind> record_kind_from_string(std::string_view text) noexcept {
  if (text == "deposit") {
    return RecordKind::kDeposit;
  }
  if (text == "withdrawal") {
    return RecordKind::kWithdrawal;
  }
  if (text == "dispute") {
    return RecordKind::kDispute;
  }
  if (text == "resolve") {
    return RecordKind::kResolve;
  }
  if (text == "chargeback") {
    return RecordKind::kChargeback;
  }
  return std::nullopt;
}

struct TransactionRecord {
  RecordKind kind{RecordKind::kDeposit};
  ClientId client{0};
  TxId tx{0};
  Amount amount{};  // zero unless carries_amount(kind)
};

}  // namespace common
}  // namespace txledger
