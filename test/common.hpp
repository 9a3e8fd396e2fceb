#pragma once

#include <memory>
#include <vector>

#include "tokenbag/tokenbag.hpp"

constexpr BagConfig newest_first_cfg(/*scan_order=*/ScanOrder::NewestFirst, /*initial_capacity=*/0);
constexpr BagConfig oldest_first_cfg(/*scan_order=*/ScanOrder::OldestFirst, /*initial_capacity=*/4);

namespace NewestFirst {
  IMPORT_TOKENBAG(newest_first_cfg)
}

namespace OldestFirst {
  IMPORT_TOKENBAG(oldest_first_cfg)
}

// deliberately neither comparable nor hashable.
template<bool is_unique>
struct Element;

template<>
struct Element<false> {
  int i;

  int get() const { return i; }
};

template<>
struct Element<true> {
  std::unique_ptr<int> ptr;

  template<typename... Args>
  Element(Args&&... args) : ptr(std::make_unique<int>(std::forward<Args>(args)...)) {}

  int get() const { return *ptr; }
};

template<typename B>
std::vector<int> values_of(const B& b) {
  std::vector<int> ret;
  for (const auto& e : b) {
    ret.push_back(e.get());
  }
  return ret;
}

// [test_id] is used to separate different tests
template<typename test_id>
struct Resource {
  static unsigned int count;
  static unsigned int destructor_count;

  int value;

  Resource(int value) : value(value) { ++count; }
  Resource(const Resource& r) : value(r.value) { ++count; }
  Resource& operator=(const Resource&) = default;
  ~Resource() { --count; ++destructor_count; }
};

template<typename test_id>
unsigned int Resource<test_id>::count = 0;

template<typename test_id>
unsigned int Resource<test_id>::destructor_count = 0;
