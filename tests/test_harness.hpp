/// \file test_harness.hpp
/// \brief Shared test utilities for all weave C++ tests.
///
/// Consolidates the CHECK/CHECK_OK/CHECK_VAL/CHECK_ERR macros, test counters,
/// and common helpers used across the unit test executables.

#ifndef WEAVE_TEST_HARNESS_HPP
#define WEAVE_TEST_HARNESS_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <chrono>
#include <functional>
#include <vector>
#include <sstream>
#include <type_traits>

namespace weave_test {

// ── Global test counters ────────────────────────────────────────────────

inline int g_pass = 0;
inline int g_fail = 0;

// ── Section tracking ────────────────────────────────────────────────────

inline std::string g_current_section;

inline void begin_section(const char* name) {
    g_current_section = name;
    std::cout << "\n=== " << name << " ===\n";
}

// ── Core check functions ────────────────────────────────────────────────

inline void check(bool ok, const char* expr, const char* file, int line) {
    if (ok) {
        ++g_pass;
    } else {
        ++g_fail;
        std::cerr << "[FAIL] " << file << ":" << line << ": " << expr << "\n";
    }
}

// ── Report ──────────────────────────────────────────────────────────────

inline int report(const char* test_name) {
    std::cout << "\n" << test_name << ": "
              << g_pass << " passed, "
              << g_fail << " failed";
    std::cout << "\n";
    return g_fail > 0 ? 1 : 0;
}

// ── Timer utility ───────────────────────────────────────────────────────

struct Timer {
    std::chrono::steady_clock::time_point start;
    const char* label;

    Timer(const char* l) : start(std::chrono::steady_clock::now()), label(l) {}
    ~Timer() {
        auto elapsed = std::chrono::steady_clock::now() - start;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        std::cout << "  [timer] " << label << ": " << ms << " ms\n";
    }
};

} // namespace weave_test

// ── Macros ──────────────────────────────────────────────────────────────

/// Basic boolean check.
#define CHECK(expr) \
    weave_test::check(static_cast<bool>(expr), #expr, __FILE__, __LINE__)

/// Check that a std::expected (Result/Status) has a value.
#define CHECK_OK(expr) \
    do { \
        auto&& _r = (expr); \
        if (_r.has_value()) { \
            ++weave_test::g_pass; \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " -> error: " \
                      << _r.error().message << " [" << _r.error().context << "]\n"; \
        } \
    } while (0)

/// Check that a std::expected has a value AND the value satisfies a predicate.
#define CHECK_VAL(expr, value_check) \
    do { \
        auto&& _r = (expr); \
        if (_r.has_value()) { \
            auto&& _v = *_r; \
            if (value_check) { \
                ++weave_test::g_pass; \
            } else { \
                ++weave_test::g_fail; \
                std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                          << ": " << #expr << " value check failed: " << #value_check << "\n"; \
            } \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " -> error: " \
                      << _r.error().message << " [" << _r.error().context << "]\n"; \
        } \
    } while (0)

/// Check that a std::expected has an error of a specific category.
#define CHECK_ERR(expr, cat) \
    do { \
        auto&& _r = (expr); \
        if (!_r.has_value() && _r.error().category == (cat)) { \
            ++weave_test::g_pass; \
        } else if (_r.has_value()) { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " expected error " << #cat << " but got success\n"; \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " expected error " << #cat \
                      << " but got different error: " << _r.error().message << "\n"; \
        } \
    } while (0)

/// Check equality of two values.
#define CHECK_EQ(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (_a == _b) { \
            ++weave_test::g_pass; \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #a << " == " << #b << "\n"; \
        } \
    } while (0)

/// Check that a < b.
#define CHECK_LT(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (_a < _b) { \
            ++weave_test::g_pass; \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #a << " < " << #b << "\n"; \
        } \
    } while (0)

/// Check that a > b.
#define CHECK_GT(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (_a > _b) { \
            ++weave_test::g_pass; \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #a << " > " << #b << "\n"; \
        } \
    } while (0)

/// Check that a string contains a substring.
#define CHECK_CONTAINS(haystack, needle) \
    do { \
        std::string _h(haystack); \
        std::string _n(needle); \
        if (_h.find(_n) != std::string::npos) { \
            ++weave_test::g_pass; \
        } else { \
            ++weave_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": string does not contain \"" << _n << "\"\n"; \
        } \
    } while (0)

/// Begin a named test section.
#define SECTION(name) \
    weave_test::begin_section(name)

#endif // WEAVE_TEST_HARNESS_HPP
