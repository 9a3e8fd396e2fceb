#pragma once

#include "../common.hpp"

#include <chrono>
#include <map>
#include <iostream>
#include <string>
#include <stack>
#include <cassert>

using ns = std::chrono::nanoseconds;

// Accumulates wall time per named scope. Nested scopes are not double counted:
//   entering a scope pauses the one around it.
// Single-threaded, like the bag it measures.
struct Profiler {
    using time_t = decltype(std::chrono::steady_clock::now());

    std::map<std::string, ns> counts;
    std::stack<std::string> stack;
    time_t last_time;

    ~Profiler() {
        if (!counts.empty()) {
            report(std::cout);
        }
    }

    void report(std::ostream& o) const {
        o << "Profiler Result: " << std::endl;
        for (const auto& [s, t] : counts) {
            o << s << ": " << t.count() << "ns" << std::endl;
        }
    }

    void reset() {
        assert(stack.empty());
        counts.clear();
    }

    static Profiler& singleton() {
        static Profiler pf;
        return pf;
    }

    static void count(const std::string& s, ns t) {
        singleton().counts[s] += t;
    }
};

struct TimeCounter {
    std::string name;

    explicit TimeCounter(std::string name) : name(std::move(name)) {
        auto t = std::chrono::steady_clock::now();
        auto& pf = Profiler::singleton();

        if (!pf.stack.empty()) {
            Profiler::count(pf.stack.top(), ns(t - pf.last_time));
        }

        pf.stack.push(this->name);
        // read the clock again so the bookkeeping above is not billed to anyone
        pf.last_time = std::chrono::steady_clock::now();
    }

    TimeCounter(const TimeCounter&) = delete;
    TimeCounter& operator=(const TimeCounter&) = delete;

    ~TimeCounter() {
        auto t = std::chrono::steady_clock::now();
        auto& pf = Profiler::singleton();

        // counters are scoped, so they close in the reverse order they opened
        assert(!pf.stack.empty() && pf.stack.top() == name);
        if (log_info) {
            std::cout << "profiler: closing " << name << std::endl;
        }

        Profiler::count(name, ns(t - pf.last_time));
        pf.stack.pop();
        pf.last_time = std::chrono::steady_clock::now();
    }
};
