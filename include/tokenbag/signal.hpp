#pragma once

#include <functional>
#include <iostream>
#include <cassert>

#include "common.hpp"
#include "config.hpp"
#include "bag.hpp"

namespace TokenBagInternal {

template<const BagConfig& cfg, typename... Args>
struct Signal;

// A move-only handle on one registration of a Signal.
// The registration is disposed when the handle dies, unless it was released first.
// The Signal must outlive every Subscription made from it.
template<const BagConfig& cfg, typename... Args>
struct Subscription {
private:
  Signal<cfg, Args...>* signal;
  Token token_;

public:
  Subscription() : signal(nullptr), token_(0) { }
  Subscription(Signal<cfg, Args...>* signal, Token token) : signal(signal), token_(token) { }

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& rhs) noexcept : signal(rhs.signal), token_(rhs.token_) {
    rhs.signal = nullptr;
  }

  Subscription& operator=(Subscription&& rhs) noexcept {
    if (this != &rhs) {
      dispose();
      signal = rhs.signal;
      token_ = rhs.token_;
      rhs.signal = nullptr;
    }
    return *this;
  }

  ~Subscription() {
    dispose();
  }

  // calling it again, or after the signal terminated, does nothing.
  void dispose() {
    if (signal != nullptr) {
      signal->dispose(token_);
      signal = nullptr;
    }
  }

  // give up ownership of the registration, which stays alive.
  // the returned token can still be passed to Signal::dispose.
  Token release() {
    signal = nullptr;
    return token_;
  }

  bool active() const {
    return signal != nullptr;
  }

  Token token() const {
    return token_;
  }
};

// Broadcasts (Args...) to every registered observer, in registration order.
// Observers live in a Bag keyed by its tokens, so std::function need not be comparable.
template<const BagConfig& cfg, typename... Args>
struct Signal {
  using Observer = std::function<void(Args...)>;

private:
  Bag<cfg, Observer> observers;

public:
  Signal() = default;
  // subscriptions point back to the signal, so it stays put.
  Signal(const Signal&) = delete;
  Signal& operator=(const Signal&) = delete;

  Token observe(Observer o) {
    assert(o);
    return observers.insert(std::move(o));
  }

  Subscription<cfg, Args...> subscribe(Observer o) {
    return Subscription<cfg, Args...>(this, observe(std::move(o)));
  }

  void dispose(Token token) {
    observers.remove(token);
  }

  bool observing(Token token) const {
    return observers.contains(token);
  }

  // dispatch walks a copy of the observers taken before the first call,
  //   so an observer may observe or dispose while being called.
  // those changes are seen from the next send on.
  // the copy costs one std::function copy per observer, and allocates for
  //   callables too large for std::function's inline buffer.
  void send(const Args&... args) {
    Bag<cfg, Observer> snapshot = observers;
    if (log_info) {
      std::cout << "signal: sending to " << snapshot.size() << " observers" << std::endl;
    }
    for (const Observer& o : snapshot) {
      o(args...);
    }
  }

  // drop every observer. tokens issued so far never come back.
  void terminate() {
    observers.clear();
  }

  size_t size() const {
    return observers.size();
  }

  bool empty() const {
    return observers.empty();
  }
};

} // end of namespace TokenBagInternal
