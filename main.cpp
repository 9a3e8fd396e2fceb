#include <iostream>
#include <string>

#include "tokenbag/tokenbag.hpp"

using namespace TokenBag;

void print(const Bag<std::string>& b) {
  std::cout << "[";
  bool first = true;
  for (const std::string& s : b) {
    std::cout << (first ? "" : ", ") << s;
    first = false;
  }
  std::cout << "] size " << b.size() << std::endl;
}

int main() {
  Bag<std::string> b;
  print(b);

  Token a = b.insert("a");
  Token t = b.insert("b");
  Token c = b.insert("c");
  std::cout << "tokens " << a << " " << t << " " << c << std::endl;
  print(b);

  b.remove(t);
  print(b);

  // already removed, nothing happens
  b.remove(t);
  print(b);

  Token d = b.insert("d");
  std::cout << "token " << d << std::endl;
  print(b);

  Signal<const std::string&> s;
  Subscription<const std::string&> sub = s.subscribe([](const std::string& msg) {
    std::cout << "observer got " << msg << std::endl;
  });
  s.send("hello");
  sub.dispose();
  s.send("nobody listens");
  return 0;
}
