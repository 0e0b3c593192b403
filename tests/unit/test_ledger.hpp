#pragma once

namespace txledger::tests {

void test_ledger_example_scenario();
void test_ledger_chargeback_keeps_available();
void test_ledger_resolve_releases_funds();
void test_ledger_terminal_states();
void test_ledger_insufficient_funds();
void test_ledger_duplicate_transaction_ids();
void test_ledger_dispute_references();
void test_ledger_locked_account();
void test_ledger_balance_overflow();
void test_ledger_finalize_orders_by_client();

}  // namespace txledger::tests
