#pragma once

#include "common.hpp"
#include "config.hpp"
#include "bag.hpp"
#include "signal.hpp"

#define IMPORT_TOKENBAG(cfg)                                                                       \
  using Token = TokenBagInternal::Token;                                                           \
  template<typename T>                                                                             \
  using Bag = TokenBagInternal::Bag<cfg, T>;                                                       \
  template<typename... Args>                                                                       \
  using Signal = TokenBagInternal::Signal<cfg, Args...>;                                           \
  template<typename... Args>                                                                       \
  using Subscription = TokenBagInternal::Subscription<cfg, Args...>;                               \
  ;

namespace TokenBag {
  IMPORT_TOKENBAG(default_config)
}
