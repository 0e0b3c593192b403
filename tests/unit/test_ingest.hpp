#pragma once

namespace txledger::tests {

void test_csv_reader_header_and_trimming();
void test_csv_reader_column_order_from_header();
void test_csv_reader_without_header();
void test_csv_reader_malformed_rows();
void test_csv_reader_error_limit();
void test_csv_reader_reference_in_amount_column();
void test_csv_reader_io_failures();

}  // namespace txledger::tests
