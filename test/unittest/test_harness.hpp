// test/unittest/test_harness.hpp
// Minimal self-registering test framework shared by the unit tests
//
//   TEST(name) { ... ASSERT_EQ(a, b); ... }
//   int main() { return run_all_tests("Suite name"); }
//
// A failed assertion prints file:line and returns from the test; an escaped
// exception also fails the test. The process exit code is the failure count.
#pragma once

#include <exception>
#include <iostream>
#include <vector>

#define TEST(name) \
    void test_##name(); \
    struct TestRegistrar_##name { \
        TestRegistrar_##name() { register_test(#name, test_##name); } \
    } registrar_##name; \
    void test_##name()

#define ASSERT_EQ(a, b) do { \
    if (!((a) == (b))) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " == " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #cond << " to be true" << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #cond << " to be false" << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_NE(a, b) do { \
    if ((a) == (b)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " != " << #b << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_GT(a, b) do { \
    if ((a) <= (b)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " > " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_LT(a, b) do { \
    if ((a) >= (b)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " < " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_NEAR(a, b, eps) do { \
    double diff_ = static_cast<double>(a) - static_cast<double>(b); \
    if (diff_ > (eps) || diff_ < -(eps)) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #a << " ~= " << #b \
                  << " (got " << (a) << " vs " << (b) << ")" << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

#define ASSERT_THROWS(expr, type) do { \
    bool thrown_ = false; \
    try { expr; } catch (const type&) { thrown_ = true; } \
    if (!thrown_) { \
        std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ \
                  << " Expected " << #expr << " to throw " << #type << std::endl; \
        mark_failed(); \
        return; \
    } \
} while(0)

// Test registry
struct Test {
    const char* name;
    void (*func)();
};

inline std::vector<Test>& tests() {
    static std::vector<Test> registry;
    return registry;
}

inline bool& current_failed() {
    static bool failed = false;
    return failed;
}

inline void mark_failed() {
    current_failed() = true;
}

inline void register_test(const char* name, void (*func)()) {
    tests().push_back({name, func});
}

inline int run_all_tests(const char* suite) {
    std::cout << "Running " << suite << " unit tests..." << std::endl;
    std::cout << "==================================" << std::endl;

    int passed = 0;
    int failed = 0;

    for (const auto& test : tests()) {
        std::cout << "Running: " << test.name << "... ";
        std::cout.flush();
        current_failed() = false;

        try {
            test.func();
            if (current_failed()) {
                std::cout << "FAIL" << std::endl;
                failed++;
            } else {
                std::cout << "PASS" << std::endl;
                passed++;
            }
        } catch (const std::exception& e) {
            std::cout << "EXCEPTION: " << e.what() << std::endl;
            failed++;
        }
    }

    std::cout << "==================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed;
}
