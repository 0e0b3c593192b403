#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "txledger/common/amount.hpp"
#include "txledger/common/types.hpp"
#include "txledger/ledger/ledger_state.hpp"

namespace txledger {
namespace report {

inline constexpr std::size_t kDigestSize = 32;
using StateDigest = std::array<std::uint8_t, kDigestSize>;

struct AccountRow {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};
};

// Rows in ascending client id, whatever order the accounts arrive in.
std::vector<AccountRow> project(const std::vector<ledger::Account>& accounts);

// Header plus one "client,available,held,total,locked" line per row.
// Throws std::runtime_error if the stream fails.
void write_csv(std::ostream& out, const std::vector<AccountRow>& rows);
std::string render_csv(const std::vector<AccountRow>& rows);

// BLAKE2b-256 over render_csv(rows).
StateDigest state_digest(const std::vector<AccountRow>& rows);
std::string to_hex(const StateDigest& digest);

}  // namespace report
}  // namespace txledger
