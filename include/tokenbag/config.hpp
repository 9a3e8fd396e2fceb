#pragma once

#include <cstddef>
#include <iostream>

#include "common.hpp"

// the direction Bag::remove and Bag::contains scan the stored tokens in.
// tokens are unique, so this only changes the cost, never the result.
enum class ScanOrder {
  // short-lived subscriptions are disposed soon after they are made,
  // so the newest entry is the most likely match.
  NewestFirst = 0,
  OldestFirst
};

inline std::ostream& operator<<(std::ostream& o, const ScanOrder& s) {
  return o << (s == ScanOrder::NewestFirst ? "newest-first" : "oldest-first");
}

struct BagConfig {
  ScanOrder scan_order;
  // slots reserved on construction, 0 to leave it to the vector.
  size_t initial_capacity;
  constexpr BagConfig(const ScanOrder& scan_order, size_t initial_capacity) :
    scan_order(scan_order),
    initial_capacity(initial_capacity)
  { }
};

inline constexpr BagConfig default_config(/*scan_order=*/ScanOrder::NewestFirst, /*initial_capacity=*/0);
