#pragma once

#include <cstdint>
#include <cassert>
#include <utility>

constexpr bool log_info = false;

template<typename T>
T non_null(T&& x) {
  assert(x);
  return std::forward<T>(x);
}

namespace TokenBagInternal {

// Tokens are minted from a per-bag counter and never reused.
// Practically, the counter only overflows if we insert every nanosecond for 500+ years.
using Token = uint64_t;

} // end of namespace TokenBagInternal
