#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include <cassert>

#include "tokenbag/tokenbag.hpp"
#include "tokenbag/profiler/profiler.hpp"

constexpr BagConfig newest_first_cfg(/*scan_order=*/ScanOrder::NewestFirst, /*initial_capacity=*/0);
constexpr BagConfig oldest_first_cfg(/*scan_order=*/ScanOrder::OldestFirst, /*initial_capacity=*/0);

namespace NewestFirst {
  IMPORT_TOKENBAG(newest_first_cfg)
}

namespace OldestFirst {
  IMPORT_TOKENBAG(oldest_first_cfg)
}

// fill a bag with [n] elements, then remove all of them.
// - lifo: remove the most recent insertion first, like short-lived subscriptions.
//   otherwise remove the oldest first.
template<typename B>
void run(const std::string& name, size_t n, bool lifo) {
  B b;
  std::vector<TokenBagInternal::Token> tokens;
  tokens.reserve(n);
  {
    TimeCounter tc(name + " insert");
    for (size_t i = 0; i < n; ++i) {
      tokens.push_back(b.insert(static_cast<int>(i)));
    }
  }
  {
    TimeCounter tc(name + (lifo ? " remove lifo" : " remove fifo"));
    if (lifo) {
      for (size_t i = n; i > 0; --i) {
        b.remove(tokens[i - 1]);
      }
    } else {
      for (size_t i = 0; i < n; ++i) {
        b.remove(tokens[i]);
      }
    }
  }
  assert(b.empty());
}

int main(int argc, char** argv) {
  size_t n = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 20000;
  std::cout << "removing " << n << " elements" << std::endl;

  run<NewestFirst::Bag<int>>("newest-first", n, true);
  run<NewestFirst::Bag<int>>("newest-first", n, false);
  run<OldestFirst::Bag<int>>("oldest-first", n, true);
  run<OldestFirst::Bag<int>>("oldest-first", n, false);

  Profiler::singleton().report(std::cout);
  Profiler::singleton().reset();
  return 0;
}
