/**
 * @file test_support.hpp
 * @brief Shared pass/fail bookkeeping for the test executables.
 */

#pragma once

#include <cmath>
#include <iostream>
#include <string>

namespace commute_test {

struct TestResult {
    int total = 0;
    int passed = 0;
    int failed = 0;
};

inline TestResult& results() {
    static TestResult r;
    return r;
}

inline void check(bool ok, const std::string& what) {
    TestResult& r = results();
    ++r.total;
    if (ok) {
        ++r.passed;
    } else {
        ++r.failed;
        std::cerr << "FAIL: " << what << "\n";
    }
}

inline void check_near(double actual, double expected, const std::string& what,
                       double tolerance = 1e-9) {
    bool ok = std::abs(actual - expected) <= tolerance;
    if (!ok) {
        std::cerr << "  expected=" << expected << " got=" << actual << "\n";
    }
    check(ok, what);
}

inline int finish(const char* suite) {
    const TestResult& r = results();
    std::cout << std::string(50, '=') << "\n";
    std::cout << suite << ": " << r.passed << "/" << r.total << " passed\n";
    if (r.failed == 0) {
        std::cout << "ALL TESTS PASSED\n";
        return 0;
    }
    std::cout << r.failed << " TESTS FAILED\n";
    return 1;
}

}  // namespace commute_test
