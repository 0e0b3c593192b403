#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace txledger {
namespace common {

// Fixed-point currency value with four fractional digits, stored as a scaled
// 64-bit integer (1.0 == 10'000).
class Amount {
 public:
  static constexpr std::size_t kFractionalDigits = 4;
  static constexpr std::int64_t kScale = 10'000;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_raw(std::int64_t raw) noexcept {
    Amount amount;
    amount.raw_ = raw;
    return amount;
  }

  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) noexcept {
    return from_raw(units * kScale);
  }

  // Parses a non-negative decimal such as "1", "1.5", ".25" or " 2.0000 ".
  // Digits past the fourth fractional place are rounded half-up.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text);

  [[nodiscard]] constexpr std::int64_t raw() const noexcept { return raw_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return raw_ < 0; }
  [[nodiscard]] constexpr bool is_zero() const noexcept { return raw_ == 0; }

  [[nodiscard]] std::optional<Amount> checked_add(Amount other) const noexcept;
  [[nodiscard]] std::optional<Amount> checked_sub(Amount other) const noexcept;

  // Always renders exactly four fractional digits: "-0.5000", "12.0000".
  [[nodiscard]] std::string to_string() const;

  constexpr Amount operator+(Amount other) const noexcept { return from_raw(raw_ + other.raw_); }
  constexpr Amount operator-(Amount other) const noexcept { return from_raw(raw_ - other.raw_); }

  constexpr auto operator<=>(const Amount&) const noexcept = default;

 private:
  std::int64_t raw_{0};
};

}  // namespace common
}  // namespace txledger
