#include "txledger/report/account_report.hpp"

#include <sodium.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace txledger {
namespace report {

namespace {

constexpr const char* kHeader = "client,available,held,total,locked";

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

void write_rows(std::ostream& out, const std::vector<AccountRow>& rows) {
  out << kHeader << '\n';
  for (const auto& row : rows) {
    out << row.client << ',' << row.available.to_string() << ',' << row.held.to_string() << ','
        << row.total.to_string() << ',' << (row.locked ? "true" : "false") << '\n';
  }
}

}  // namespace

std::vector<AccountRow> project(const std::vector<ledger::Account>& accounts) {
  std::vector<AccountRow> rows;
  rows.reserve(accounts.size());
  for (const auto& account : accounts) {
    rows.push_back(AccountRow{
        .client = account.client,
        .available = account.available,
        .held = account.held,
        .total = account.total(),
        .locked = account.locked,
    });
  }
  std::sort(rows.begin(), rows.end(),
            [](const AccountRow& lhs, const AccountRow& rhs) { return lhs.client < rhs.client; });
  return rows;
}

void write_csv(std::ostream& out, const std::vector<AccountRow>& rows) {
  write_rows(out, rows);
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
}

std::string render_csv(const std::vector<AccountRow>& rows) {
  std::ostringstream out;
  write_rows(out, rows);
  return out.str();
}

StateDigest state_digest(const std::vector<AccountRow>& rows) {
  ensure_sodium_init();

  const auto canonical = render_csv(rows);
  StateDigest digest{};
  if (crypto_generichash(digest.data(), digest.size(),
                         reinterpret_cast<const unsigned char*>(canonical.data()), canonical.size(),
                         nullptr, 0) != 0) {
    throw std::runtime_error("failed to hash account state");
  }
  return digest;
}

std::string to_hex(const StateDigest& digest) {
  std::string hex(digest.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
  hex.pop_back();
  return hex;
}

}  // namespace report
}  // namespace txledger
