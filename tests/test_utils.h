#pragma once

/**
 * @file test_utils.h
 * @brief Utilities for testing voxel terrain components
 *
 * Provides assertions, a test registry and scratch directories without external test frameworks
 */

#include <iostream>
#include <stdexcept>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

// ============================================================
// Test Assertion Macros
// ============================================================

#define ASSERT_TRUE(condition) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_TRUE failed: " #condition); \
        } \
    } while(0)

#define ASSERT_FALSE(condition) ASSERT_TRUE(!(condition))

#define ASSERT_EQ(a, b) \
    do { \
        if ((a) != (b)) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_EQ failed: " #a " != " #b); \
        } \
    } while(0)

#define ASSERT_NE(a, b) ASSERT_TRUE((a) != (b))

#define ASSERT_LT(a, b) ASSERT_TRUE((a) < (b))
#define ASSERT_LE(a, b) ASSERT_TRUE((a) <= (b))
#define ASSERT_GT(a, b) ASSERT_TRUE((a) > (b))
#define ASSERT_GE(a, b) ASSERT_TRUE((a) >= (b))

// Passes only if expr throws exception_type (or a subclass)
#define ASSERT_THROWS(expr, exception_type) \
    do { \
        bool caught_expected = false; \
        try { \
            (void)(expr); \
        } catch (const exception_type&) { \
            caught_expected = true; \
        } \
        if (!caught_expected) { \
            throw std::runtime_error(std::string(__FILE__) + ":" + std::to_string(__LINE__) + \
                                   " ASSERT_THROWS failed: " #expr " did not throw " #exception_type); \
        } \
    } while(0)

#define ASSERT_NULL(ptr) ASSERT_EQ((ptr), nullptr)
#define ASSERT_NOT_NULL(ptr) ASSERT_TRUE((ptr) != nullptr)

// ============================================================
// Test Results Tracking
// ============================================================

struct TestResult {
    std::string name;
    bool passed;
    std::string error;
    double duration_ms;
};

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner runner;
        return runner;
    }

    void add_result(const TestResult& result) {
        results.push_back(result);
    }

    void print_summary() {
        std::cout << "\n========================================\n";
        std::cout << "TEST SUMMARY\n";
        std::cout << "========================================\n";

        int passed = 0, failed = 0;
        double total_time = 0.0;

        for (const auto& result : results) {
            if (result.passed) {
                std::cout << "✓ " << result.name << " (" << result.duration_ms << " ms)\n";
                passed++;
            } else {
                std::cout << "✗ " << result.name << " (" << result.duration_ms << " ms)\n";
                std::cout << "  ERROR: " << result.error << "\n";
                failed++;
            }
            total_time += result.duration_ms;
        }

        std::cout << "\n" << passed << " passed, " << failed << " failed\n";
        std::cout << "Total time: " << total_time << " ms\n";
        std::cout << "========================================\n";

        if (failed > 0) {
            throw std::runtime_error(std::to_string(failed) + " test(s) failed");
        }
    }

private:
    std::vector<TestResult> results;
};

// ============================================================
// Test Macros for Running Tests
// ============================================================

#define TEST(test_name) \
    void test_##test_name(); \
    namespace { \
        struct TestRunner_##test_name { \
            TestRunner_##test_name() { \
                register_test(#test_name, &test_##test_name); \
            } \
        } runner_##test_name; \
    } \
    void test_##test_name()

static std::vector<std::pair<std::string, void(*)()>> all_tests;

inline void register_test(const std::string& name, void (*fn)()) {
    all_tests.push_back({name, fn});
}

inline void run_all_tests() {
    for (const auto& [name, fn] : all_tests) {
        TestResult result;
        result.name = name;

        auto start = std::chrono::high_resolution_clock::now();
        try {
            fn();
            result.passed = true;
        } catch (const std::exception& e) {
            result.passed = false;
            result.error = e.what();
        }
        auto end = std::chrono::high_resolution_clock::now();
        result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();

        TestRunner::instance().add_result(result);
    }

    TestRunner::instance().print_summary();
}

// ============================================================
// Temporary Directories
// ============================================================

/**
 * @brief Unique scratch directory under the system temp path, removed on destruction
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix) {
        namespace fs = std::filesystem;
        static int counter = 0;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("voxel_terrain_" + prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            std::cerr << "  warning: failed to remove " << path_ << ": " << ec.message() << "\n";
        }
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    /// Path of a child entry as a string
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// ============================================================
// Performance Timing
// ============================================================

class ScopedTimer {
public:
    ScopedTimer(const std::string& name) : name_(name) {
        start_ = std::chrono::high_resolution_clock::now();
    }

    ~ScopedTimer() {
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start_).count();
        std::cout << "  " << name_ << ": " << ms << " ms\n";
    }

    double elapsed_ms() const {
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

private:
    std::string name_;
    std::chrono::high_resolution_clock::time_point start_;
};
