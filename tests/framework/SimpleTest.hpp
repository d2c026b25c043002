#pragma once

#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tunebox::test {

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner instance;
        return instance;
    }

    void register_test(const std::string& name, std::function<void()> test_func) {
        tests_.push_back({name, std::move(test_func)});
    }

    int run_all(const std::string& suite = "TUNEBOX") {
        int passed = 0;
        int failed = 0;

        std::cout << "\n=== " << suite << " TEST SUITE ===\n" << std::endl;

        for (const auto& test : tests_) {
            auto started = std::chrono::steady_clock::now();
            try {
                test.func();
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started).count();
                std::cout << "[PASS] " << test.name << " (" << ms << " ms)" << std::endl;
                passed++;
            } catch (const std::exception& e) {
                std::cout << "[FAIL] " << test.name << " - " << e.what() << std::endl;
                failed++;
            } catch (...) {
                std::cout << "[FAIL] " << test.name << " - Unknown exception" << std::endl;
                failed++;
            }
        }

        std::cout << "\nResults: " << passed << " Passed, " << failed << " Failed." << std::endl;
        return failed > 0 ? 1 : 0;
    }

private:
    struct TestEntry {
        std::string name;
        std::function<void()> func;
    };
    std::vector<TestEntry> tests_;
};

struct Registrar {
    Registrar(const std::string& name, std::function<void()> func) {
        TestRunner::instance().register_test(name, std::move(func));
    }
};

class AssertionFailure : public std::runtime_error {
public:
    explicit AssertionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

inline std::string where(const char* file, int line) {
    return std::string(" at ") + file + ":" + std::to_string(line);
}

}  // namespace tunebox::test

#define TEST_CASE(name) \
    void name(); \
    static tunebox::test::Registrar reg_##name(#name, name); \
    void name()

#define ASSERT_TRUE(condition) \
    if (!(condition)) throw tunebox::test::AssertionFailure("Assertion failed: " #condition + tunebox::test::where(__FILE__, __LINE__))

#define ASSERT_FALSE(condition) \
    if (condition) throw tunebox::test::AssertionFailure("Assertion failed: " #condition " is true" + tunebox::test::where(__FILE__, __LINE__))

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw tunebox::test::AssertionFailure("Assertion failed: " #a " == " #b + tunebox::test::where(__FILE__, __LINE__))

#define ASSERT_NEAR(a, b, epsilon) \
    if (std::abs((a) - (b)) > epsilon) throw tunebox::test::AssertionFailure("Assertion failed: " #a " near " #b + tunebox::test::where(__FILE__, __LINE__))
