#pragma once

#include <vector>
#include <cstddef>
#include <cassert>
#include <iostream>
#include <iterator>
#include <optional>
#include <type_traits>
#include <initializer_list>

#include "common.hpp"
#include "config.hpp"

namespace TokenBagInternal {

// an unordered, non-unique container of T.
// insert hands out a token, and the token is the only way to remove that entry again,
//   so T need not be comparable or hashable.
// insert is amortized constant time, remove is linear.
// iteration visits the surviving elements in the order they were inserted.
//
// Bag is not synchronized. mutating it while iterating over it is undefined.
template<const BagConfig& cfg, typename T>
struct Bag {
private:
  // index-aligned: tokens[i] was issued for elements[i].
  std::vector<T> elements;
  std::vector<Token> tokens;
  Token next_token = 0;

public:
  template<bool is_const>
  struct Iterator {
    using bag_t = std::conditional_t<is_const, const Bag, Bag>;

    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = std::conditional_t<is_const, const T*, T*>;
    using reference = std::conditional_t<is_const, const T&, T&>;

    bag_t* bag;
    size_t i;

    Iterator() : bag(nullptr), i(0) { }
    Iterator(bag_t* bag, size_t i) : bag(bag), i(i) { }

    // iterator -> const_iterator
    template<bool other_const, typename = std::enable_if_t<is_const && !other_const>>
    Iterator(const Iterator<other_const>& rhs) : bag(rhs.bag), i(rhs.i) { }

    reference operator*() const {
      return (*bag)[i];
    }

    pointer operator->() const {
      return &(*bag)[i];
    }

    Iterator& operator++() {
      ++i;
      return *this;
    }

    Iterator operator++(int) {
      Iterator ret = *this;
      ++i;
      return ret;
    }

    bool operator==(const Iterator& rhs) const {
      return bag == rhs.bag && i == rhs.i;
    }

    bool operator!=(const Iterator& rhs) const {
      return !(*this == rhs);
    }
  };

  using iterator = Iterator<false>;
  using const_iterator = Iterator<true>;

  Bag() {
    if (cfg.initial_capacity > 0) {
      elements.reserve(cfg.initial_capacity);
      tokens.reserve(cfg.initial_capacity);
    }
  }

  Bag(std::initializer_list<T> l) : Bag() {
    for (const T& t : l) {
      insert(t);
    }
  }

  Token insert(const T& t) {
    return append([&]() { elements.push_back(t); });
  }

  Token insert(T&& t) {
    return append([&]() { elements.push_back(std::move(t)); });
  }

  template<typename... Args>
  Token emplace(Args&&... args) {
    return append([&]() { elements.emplace_back(std::forward<Args>(args)...); });
  }

  // remove the entry [token] was issued for.
  // a token that was already removed, or never came from this bag, is ignored.
  void remove(Token token) {
    std::optional<size_t> idx = find(token);
    if (!idx) {
      if (log_info) {
        std::cout << "bag: no entry for token " << token << " (" << cfg.scan_order << " scan over "
                  << tokens.size() << " entries), remove ignored" << std::endl;
      }
      return;
    }
    elements.erase(elements.begin() + *idx);
    tokens.erase(tokens.begin() + *idx);
  }

  bool contains(Token token) const {
    return find(token).has_value();
  }

  // drop every entry. the counter keeps going, so old tokens stay dead.
  void clear() {
    elements.clear();
    tokens.clear();
  }

  size_t size() const {
    return elements.size();
  }

  bool empty() const {
    return size() == 0;
  }

  size_t start_index() const {
    return 0;
  }

  size_t end_index() const {
    return size();
  }

  T& operator[](size_t i) {
    assert(i < size());
    return elements[i];
  }

  const T& operator[](size_t i) const {
    assert(i < size());
    return elements[i];
  }

  iterator begin() {
    return iterator(this, start_index());
  }

  iterator end() {
    return iterator(this, end_index());
  }

  const_iterator begin() const {
    return const_iterator(this, start_index());
  }

  const_iterator end() const {
    return const_iterator(this, end_index());
  }

  const_iterator cbegin() const {
    return begin();
  }

  const_iterator cend() const {
    return end();
  }

private:
  // the token goes in first and is taken back out if the element cannot be added,
  //   so a throwing constructor or allocation leaves both vectors aligned.
  // the counter only moves once both appends succeeded.
  template<typename F>
  Token append(const F& push_element) {
    Token token = next_token;
    tokens.push_back(token);
    try {
      push_element();
    } catch (...) {
      tokens.pop_back();
      throw;
    }
    ++next_token;
    assert(elements.size() == tokens.size());
    return token;
  }

  std::optional<size_t> find(Token token) const {
    if (cfg.scan_order == ScanOrder::NewestFirst) {
      for (size_t i = tokens.size(); i > 0; --i) {
        if (tokens[i - 1] == token) {
          return i - 1;
        }
      }
    } else {
      for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] == token) {
          return i;
        }
      }
    }
    return std::nullopt;
  }
};

} // end of namespace TokenBagInternal
