#pragma once

#include <cstdint>
#include <limits>
#include <vector>

using Bytes = std::vector<unsigned char>;
using Amount = int64_t;

inline constexpr Amount kCoin = 100000000;
inline constexpr Amount kMaxAmount = std::numeric_limits<Amount>::max();

inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
  if (a < 0 || b < 0) {
    return false;
  }
  if (kMaxAmount - a < b) {
    return false;
  }
  out = a + b;
  return true;
}

inline bool CheckedMul(Amount a, Amount b, Amount& out) {
  if (a < 0 || b < 0) {
    return false;
  }
  if (b != 0 && a > kMaxAmount / b) {
    return false;
  }
  out = a * b;
  return true;
}
