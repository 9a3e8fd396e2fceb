#pragma once

#include <cstddef>
#include <cstdint>

#include "config.hpp"
#include "bag.hpp"

// C view of a bag of opaque pointers.
// the bag never owns or dereferences what it stores.
extern "C" {
  using TokenBagHandle = TokenBagInternal::Bag<default_config, void*>;

  TokenBagHandle* tokenbag_new();
  void tokenbag_delete(TokenBagHandle* bag);
  uint64_t tokenbag_insert(TokenBagHandle* bag, void* elm);
  void tokenbag_remove(TokenBagHandle* bag, uint64_t token);
  bool tokenbag_contains(const TokenBagHandle* bag, uint64_t token);
  size_t tokenbag_size(const TokenBagHandle* bag);
  bool tokenbag_empty(const TokenBagHandle* bag);
  void* tokenbag_index(const TokenBagHandle* bag, size_t i);
  void tokenbag_clear(TokenBagHandle* bag);
}
