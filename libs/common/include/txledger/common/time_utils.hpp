#pragma once

#include <chrono>

namespace txledger {
namespace common {

inline std::chrono::nanoseconds now_steady() noexcept {
  return std::chrono::steady_clock::now().time_since_epoch();
}

// Runs fn and returns how long it took on the steady clock.
template <typename Fn>
std::chrono::nanoseconds time_steady(Fn&& fn) {
  const auto start = now_steady();
  fn();
  return now_steady() - start;
}

}  // namespace common
}  // namespace txledger
