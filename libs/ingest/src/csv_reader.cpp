#include "txledger/ingest/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace txledger {
namespace ingest {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string_view trim(std::string_view text) noexcept {
  const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string_view> split_fields(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return fields;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  T value{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

CsvReader::CsvReader(const std::filesystem::path& path) : CsvReader(path, Options{}) {}

CsvReader::CsvReader(const std::filesystem::path& path, Options options)
    : file_(path), input_(&file_), options_(options) {
  if (!file_) {
    throw std::runtime_error("failed to open transaction input: " + path.string());
  }
}

CsvReader::CsvReader(std::istream& input) : CsvReader(input, Options{}) {}

CsvReader::CsvReader(std::istream& input, Options options) : input_(&input), options_(options) {}

bool CsvReader::next(common::TransactionRecord& out) {
  std::string line;
  while (std::getline(*input_, line)) {
    ++stats_.lines;

    std::string_view view{line};
    if (stats_.lines == 1 && view.starts_with(kUtf8Bom)) {
      view.remove_prefix(kUtf8Bom.size());
    }

    const auto fields = split_fields(view);
    const bool blank = std::all_of(fields.begin(), fields.end(),
                                   [](std::string_view field) { return field.empty(); });
    if (blank) {
      ++stats_.blank_lines;
      continue;
    }

    if (first_row_) {
      first_row_ = false;
      if (try_read_header(fields)) {
        continue;
      }
      if (options_.require_header) {
        throw std::runtime_error("transaction input does not start with a header row");
      }
    }

    if (auto record = parse_row(fields)) {
      ++stats_.records;
      out = *record;
      return true;
    }
  }

  if (input_->bad()) {
    throw std::runtime_error("failed to read transaction input at line " +
                             std::to_string(stats_.lines + 1));
  }
  return false;
}

bool CsvReader::try_read_header(const std::vector<std::string_view>& fields) {
  std::array<std::optional<std::size_t>, kColumnCount> mapped{};
  bool has_type = false;

  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto name = to_lower(fields[i]);
    if (name == "type") {
      mapped[kType] = i;
      has_type = true;
    } else if (name == "client") {
      mapped[kClient] = i;
    } else if (name == "tx") {
      mapped[kTx] = i;
    } else if (name == "amount") {
      mapped[kAmount] = i;
    }
  }

  if (!has_type) {
    return false;
  }
  if (!mapped[kClient]) {
    throw std::runtime_error("header row is missing the 'client' column");
  }
  if (!mapped[kTx]) {
    throw std::runtime_error("header row is missing the 'tx' column");
  }

  columns_ = mapped;
  return true;
}

std::optional<common::TransactionRecord> CsvReader::parse_row(const std::vector<std::string_view>& fields) {
  const auto field = [&](Column column) -> std::string_view {
    const auto index = columns_[column];
    if (!index || *index >= fields.size()) {
      return {};
    }
    return fields[*index];
  };

  const auto type_text = field(kType);
  const auto kind = common::record_kind_from_string(to_lower(type_text));
  if (!kind) {
    record_error("unknown transaction type '" + std::string(type_text) + "'");
    return std::nullopt;
  }

  const auto client = parse_unsigned<common::ClientId>(field(kClient));
  if (!client) {
    record_error("invalid client id '" + std::string(field(kClient)) + "'");
    return std::nullopt;
  }

  auto tx = parse_unsigned<common::TxId>(field(kTx));
  // Dispute-family rows may carry the referenced id in the amount column
  // with the tx column left empty ("dispute,1,,1").
  if (!tx && !common::carries_amount(*kind) && field(kTx).empty()) {
    tx = parse_unsigned<common::TxId>(field(kAmount));
  }
  if (!tx) {
    record_error("invalid transaction id '" + std::string(field(kTx)) + "'");
    return std::nullopt;
  }

  common::TransactionRecord record{
      .kind = *kind,
      .client = *client,
      .tx = *tx,
      .amount = {},
  };

  if (common::carries_amount(*kind)) {
    const auto amount_text = field(kAmount);
    if (amount_text.empty()) {
      record_error("missing amount for " + std::string(common::to_string(*kind)));
      return std::nullopt;
    }
    const auto amount = common::Amount::parse(amount_text);
    if (!amount) {
      record_error("invalid amount '" + std::string(amount_text) + "'");
      return std::nullopt;
    }
    record.amount = *amount;
  }

  return record;
}

void CsvReader::record_error(std::string message) {
  ++stats_.malformed;
  if (errors_.size() < options_.max_recorded_errors) {
    errors_.push_back(ParseError{.line = stats_.lines, .message = std::move(message)});
  }
}

}  // namespace ingest
}  // namespace txledger
