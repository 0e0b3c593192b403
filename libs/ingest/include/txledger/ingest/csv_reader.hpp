#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "txledger/common/transaction.hpp"

namespace txledger {
namespace ingest {

struct ParseError {
  std::uint64_t line{0};
  std::string message;
};

// Streams TransactionRecords out of comma-separated text with the columns
// type, client, tx, amount. A first row naming a "type" column is a header and
// fixes the column order; otherwise the order above is assumed.
//
// A dispute, resolve or chargeback row with an empty tx column takes its
// transaction id from the amount column.
//
// Malformed rows are skipped and counted. Only I/O failures throw.
class CsvReader {
 public:
  struct Options {
    bool require_header{false};
    std::size_t max_recorded_errors{32};
  };

  struct Stats {
    std::uint64_t lines{0};
    std::uint64_t records{0};
    std::uint64_t blank_lines{0};
    std::uint64_t malformed{0};
  };

  explicit CsvReader(const std::filesystem::path& path);
  CsvReader(const std::filesystem::path& path, Options options);
  explicit CsvReader(std::istream& input);
  CsvReader(std::istream& input, Options options);
  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;

  // Returns false once the input is exhausted.
  bool next(common::TransactionRecord& out);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] const std::vector<ParseError>& errors() const noexcept { return errors_; }

 private:
  enum Column : std::size_t { kType = 0, kClient, kTx, kAmount, kColumnCount };

  std::ifstream file_;
  std::istream* input_{nullptr};
  Options options_{};
  Stats stats_{};
  std::vector<ParseError> errors_{};
  std::array<std::optional<std::size_t>, kColumnCount> columns_{0, 1, 2, 3};
  bool first_row_{true};

  // Fills columns_ when the row is a header; returns false otherwise.
  bool try_read_header(const std::vector<std::string_view>& fields);
  std::optional<common::TransactionRecord> parse_row(const std::vector<std::string_view>& fields);
  void record_error(std::string message);
};

}  // namespace ingest
}  // namespace txledger
