#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

// Minimal case runner shared by the test programs. A case returns true on
// success and may fill `why` with the reason of a failure.
using TestCase = std::function<bool(std::string* why)>;

struct NamedCase {
    std::string name;
    TestCase run;
};

inline int run_cases(const std::string& suite, const std::vector<NamedCase>& cases) {
    size_t passed = 0;
    size_t failed = 0;

    for (const auto& c : cases) {
        std::string why;
        bool ok = false;
        try {
            ok = c.run(&why);
        } catch (const std::exception& e) {
            why = std::string("unexpected exception: ") + e.what();
        }

        if (ok) {
            passed++;
            std::cout << "[" << suite << "] " << c.name << ": PASSED\n";
        } else {
            failed++;
            std::cout << "[" << suite << "] " << c.name << ": FAILED (" << why << ")\n";
        }
    }

    std::cout << "SUMMARY: total=" << cases.size() << " passed=" << passed << " failed=" << failed << "\n";
    return failed == 0 ? 0 : 1;
}

// Records the failure reason; returns false so a case can `return fail(why, ...)`
inline bool fail(std::string* why, const std::string& msg) {
    if (why) *why = msg;
    return false;
}
