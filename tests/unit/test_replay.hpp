#pragma once

namespace txledger::tests {

void test_driver_example_scenario();
void test_driver_reference_in_amount_column();
void test_driver_outcome_handler_and_telemetry();
void test_driver_determinism();
void test_partitioned_matches_sequential();
void test_partition_independence();
void test_partitioned_duplicate_ids_across_clients();
void test_partitioned_source_error();
void test_partitioned_outcome_handler();

}  // namespace txledger::tests
