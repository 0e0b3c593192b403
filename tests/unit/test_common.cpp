#include "test_common.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "txledger/common/amount.hpp"
#include "txledger/common/spsc_ring.hpp"
#include "txledger/common/transaction.hpp"

namespace txledger::tests {

void test_amount_parse() {
  using common::Amount;

  assert(Amount::parse("1.0")->raw() == 10'000);
  assert(Amount::parse(" 2.5 ")->raw() == 25'000);
  assert(Amount::parse(".5")->raw() == 5'000);
  assert(Amount::parse("3.")->raw() == 30'000);
  assert(Amount::parse("+7")->raw() == 70'000);
  assert(Amount::parse("0")->raw() == 0);
  assert(Amount::parse("0.1234")->raw() == 1'234);

  // Fifth fractional digit rounds half-up, the rest are ignored.
  assert(Amount::parse("0.12345")->raw() == 1'235);
  assert(Amount::parse("0.123449")->raw() == 1'234);
  assert(Amount::parse("0.99995")->raw() == 10'000);

  assert(Amount::parse("922337203685477.5807")->raw() == std::numeric_limits<std::int64_t>::max());
  assert(!Amount::parse("922337203685477.5808"));
  assert(!Amount::parse("99999999999999999999"));

  assert(!Amount::parse(""));
  assert(!Amount::parse("   "));
  assert(!Amount::parse("."));
  assert(!Amount::parse("-1.0"));
  assert(!Amount::parse("1.2.3"));
  assert(!Amount::parse("1e5"));
  assert(!Amount::parse("abc"));
  assert(!Amount::parse("1 000"));
}

void test_amount_format() {
  using common::Amount;

  assert(Amount{}.to_string() == "0.0000");
  assert(Amount::from_raw(1).to_string() == "0.0001");
  assert(Amount::from_raw(5'000).to_string() == "0.5000");
  assert(Amount::from_raw(-5'000).to_string() == "-0.5000");
  assert(Amount::from_units(12).to_string() == "12.0000");
  assert(Amount::from_raw(-123'456).to_string() == "-12.3456");
  assert(Amount::from_raw(std::numeric_limits<std::int64_t>::min()).to_string() == "-922337203685477.5808");
}

void test_amount_checked_arithmetic() {
  using common::Amount;

  const auto max = Amount::from_raw(std::numeric_limits<std::int64_t>::max());
  const auto min = Amount::from_raw(std::numeric_limits<std::int64_t>::min());
  const auto tick = Amount::from_raw(1);

  assert(!max.checked_add(tick));
  assert(max.checked_sub(tick)->raw() == std::numeric_limits<std::int64_t>::max() - 1);
  assert(!min.checked_sub(tick));
  assert(!min.checked_add(Amount::from_raw(-1)));

  const auto diff = Amount::from_units(1).checked_sub(Amount::from_units(2));
  assert(diff && diff->raw() == -10'000);
  assert(Amount::from_units(1) < Amount::from_units(2));
  assert(Amount::parse("1.5") == Amount::from_raw(15'000));
}

void test_record_kind_names() {
  using common::RecordKind;

  assert(common::record_kind_from_string("deposit") == RecordKind::kDeposit);
  assert(common::record_kind_from_string("chargeback") == RecordKind::kChargeback);
  assert(!common::record_kind_from_string("Deposit"));
  assert(!common::record_kind_from_string("transfer"));
  assert(common::to_string(RecordKind::kResolve) == "resolve");
  assert(common::carries_amount(RecordKind::kWithdrawal));
  assert(!common::carries_amount(RecordKind::kDispute));
}

void test_spsc_ring() {
  common::SpscRing<int> ring(4);
  assert(ring.capacity() == 3);
  assert(ring.empty());

  assert(ring.push(1));
  assert(ring.push(2));
  assert(ring.push(3));
  assert(!ring.push(4));  // one slot stays free

  int value = 0;
  assert(ring.pop(value) && value == 1);
  assert(ring.push(4));
  assert(ring.pop(value) && value == 2);
  assert(ring.pop(value) && value == 3);
  assert(ring.pop(value) && value == 4);
  assert(!ring.pop(value));

  assert(!ring.closed());
  ring.close();
  assert(ring.closed());

  bool threw = false;
  try {
    common::SpscRing<int> bad(6);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace txledger::tests
