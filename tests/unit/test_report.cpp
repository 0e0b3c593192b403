#include "test_report.hpp"

#include <cassert>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "txledger/ledger/ledger_state.hpp"
#include "txledger/report/account_report.hpp"

namespace txledger::tests {

namespace {

ledger::Account make_account(common::ClientId client, std::int64_t available_raw, std::int64_t held_raw,
                             bool locked) {
  return ledger::Account{
      .client = client,
      .available = common::Amount::from_raw(available_raw),
      .held = common::Amount::from_raw(held_raw),
      .locked = locked,
  };
}

}  // namespace

void test_report_render() {
  const std::vector<ledger::Account> accounts = {
      make_account(2, 20'000, 0, false),
      make_account(1, 5'000, 0, true),
  };

  const auto rows = report::project(accounts);
  assert(rows.size() == 2);
  assert(rows[0].client == 1);
  assert(rows[1].total == common::Amount::from_units(2));

  assert(report::render_csv(rows) ==
         "client,available,held,total,locked\n"
         "1,0.5000,0.0000,0.5000,true\n"
         "2,2.0000,0.0000,2.0000,false\n");

  // A disputed deposit that was already spent leaves available negative.
  const auto negative = report::project({make_account(9, -30'000, 50'000, false)});
  assert(report::render_csv(negative) ==
         "client,available,held,total,locked\n"
         "9,-3.0000,5.0000,2.0000,false\n");

  assert(report::render_csv({}) == "client,available,held,total,locked\n");
}

void test_report_write_csv() {
  const auto rows = report::project({make_account(3, 12'345, 1, false)});

  std::ostringstream out;
  report::write_csv(out, rows);
  assert(out.str() == report::render_csv(rows));

  std::ostringstream broken;
  broken.setstate(std::ios::badbit);
  bool threw = false;
  try {
    report::write_csv(broken, rows);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void test_report_digest() {
  const auto rows = report::project({make_account(1, 10'000, 0, false), make_account(2, 0, 5'000, true)});
  const auto shuffled = report::project({make_account(2, 0, 5'000, true), make_account(1, 10'000, 0, false)});
  const auto changed = report::project({make_account(1, 10'001, 0, false), make_account(2, 0, 5'000, true)});

  const auto digest = report::state_digest(rows);
  assert(digest == report::state_digest(shuffled));
  assert(digest != report::state_digest(changed));
  assert(report::state_digest({}) != digest);

  const auto hex = report::to_hex(digest);
  assert(hex.size() == report::kDigestSize * 2);
  assert(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
}

}  // namespace txledger::tests
