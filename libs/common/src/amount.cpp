#include "txledger/common/amount.hpp"

#include <limits>

namespace txledger {
namespace common {

namespace {

constexpr std::int64_t kMaxRaw = std::numeric_limits<std::int64_t>::max();

bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::optional<Amount> Amount::parse(std::string_view text) {
  text = trim(text);
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  std::int64_t units = 0;
  std::size_t integer_digits = 0;
  while (pos < text.size() && is_digit(text[pos])) {
    const std::int64_t digit = text[pos] - '0';
    if (units > (kMaxRaw / kScale - digit) / 10) {
      return std::nullopt;
    }
    units = units * 10 + digit;
    ++integer_digits;
    ++pos;
  }

  std::int64_t fraction = 0;
  std::size_t fraction_digits = 0;
  bool round_up = false;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && is_digit(text[pos])) {
      const std::int64_t digit = text[pos] - '0';
      if (fraction_digits < kFractionalDigits) {
        fraction = fraction * 10 + digit;
      } else if (fraction_digits == kFractionalDigits) {
        round_up = digit >= 5;
      }
      ++fraction_digits;
      ++pos;
    }
  }

  if (pos != text.size() || (integer_digits == 0 && fraction_digits == 0)) {
    return std::nullopt;
  }

  for (std::size_t i = fraction_digits; i < kFractionalDigits; ++i) {
    fraction *= 10;
  }

  if (units > (kMaxRaw - fraction) / kScale) {
    return std::nullopt;
  }
  std::int64_t raw = units * kScale + fraction;
  if (round_up) {
    if (raw == kMaxRaw) {
      return std::nullopt;
    }
    ++raw;
  }
  return from_raw(raw);
}

std::optional<Amount> Amount::checked_add(Amount other) const noexcept {
  if ((other.raw_ > 0 && raw_ > kMaxRaw - other.raw_) ||
      (other.raw_ < 0 && raw_ < std::numeric_limits<std::int64_t>::min() - other.raw_)) {
    return std::nullopt;
  }
  return from_raw(raw_ + other.raw_);
}

std::optional<Amount> Amount::checked_sub(Amount other) const noexcept {
  if ((other.raw_ < 0 && raw_ > kMaxRaw + other.raw_) ||
      (other.raw_ > 0 && raw_ < std::numeric_limits<std::int64_t>::min() + other.raw_)) {
    return std::nullopt;
  }
  return from_raw(raw_ - other.raw_);
}

std::string Amount::to_string() const {
  const bool negative = raw_ < 0;
  // Unsigned magnitude so that the minimum value does not overflow on negation.
  const std::uint64_t magnitude = negative ? std::uint64_t{0} - static_cast<std::uint64_t>(raw_)
                                           : static_cast<std::uint64_t>(raw_);
  const auto scale = static_cast<std::uint64_t>(kScale);

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, kFractionalDigits - fraction.size(), '0');

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / scale);
  out.push_back('.');
  out += fraction;
  return out;
}

}  // namespace common
}  // namespace txledger
