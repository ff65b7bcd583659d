/**
 * @file test_utils.h
 * @brief Tiny standalone test harness: named cases + CHECK macros, output qua std::println
 */
#pragma once

#include <cinder/bytecode/program.h>
#include <cinder/errors.h>
#include <cstdio>
#include <exception>
#include <functional>
#include <initializer_list>
#include <print>
#include <span>
#include <string_view>
#include <vector>

namespace cinder::tests {

struct TestCase {
    std::string_view name;
    void (*fn)();
};

inline int g_failures = 0;

inline void report_failure(const char* file, int line, std::string_view expr) {
    ++g_failures;
    std::println("    ✗ {}:{}: {}", file, line, expr);
}

#define CHECK(expr)                                                              \
    do {                                                                         \
        if (!(expr)) ::cinder::tests::report_failure(__FILE__, __LINE__, #expr); \
    } while (0)

#define CHECK_EQ(lhs, rhs) CHECK((lhs) == (rhs))

// Kỳ vọng expr ném ra Type; `on_error` nhận exception để kiểm tra thêm
#define CHECK_THROWS(Type, expr, on_error)                                                        \
    do {                                                                                          \
        bool thrown_ = false;                                                                     \
        try { (void)(expr); }                                                                     \
        catch (const Type& e) { thrown_ = true; on_error(e); }                                     \
        catch (const std::exception& e) {                                                         \
            ::cinder::tests::report_failure(__FILE__, __LINE__, "wrong exception for " #expr);   \
            std::println("      what(): {}", e.what());                                           \
            thrown_ = true;                                                                       \
        }                                                                                         \
        if (!thrown_) ::cinder::tests::report_failure(__FILE__, __LINE__, "no " #Type " from " #expr); \
    } while (0)

inline constexpr auto ignore_error = [](const auto&) {};

inline Program make_program(std::initializer_list<Instruction> insts, size_t memory_size = DEFAULT_MEMORY_SIZE) {
    return Program(std::vector<Instruction>(insts), memory_size);
}

inline int run_tests(std::string_view suite, std::span<const TestCase> cases) {
    std::println("┌─ {} ({} cases)", suite, cases.size());
    int failed_cases = 0;
    for (const TestCase& tc : cases) {
        const int before = g_failures;
        try {
            tc.fn();
        } catch (const std::exception& e) {
            report_failure(__FILE__, __LINE__, "unexpected exception");
            std::println("      what(): {}", e.what());
        }
        const bool ok = g_failures == before;
        if (!ok) ++failed_cases;
        std::println("│ [{}] {}", ok ? " OK " : "FAIL", tc.name);
    }
    std::println("└─ {} passed, {} failed", cases.size() - failed_cases, failed_cases);
    std::fflush(stdout);
    return failed_cases == 0 ? 0 : 1;
}

} // namespace cinder::tests
