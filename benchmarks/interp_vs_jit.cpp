/**
 * @file interp_vs_jit.cpp
 * @brief Benchmark: Native C++ vs CinderVM Interpreter vs CinderVM JIT
 */

#include <chrono>
#include <iomanip>
#include <iostream>
#include <locale>
#include <optional>
#include <string>

#include <cinder/config.h>
#include <cinder/errors.h>
#include <cinder/jit/jit_compiler.h>
#include <cinder/vm/interpreter.h>

using namespace cinder;

// --- UTILS: Màu sắc và Log ---
namespace Color {
    const std::string RESET   = "\033[0m";
    const std::string RED     = "\033[31m";
    const std::string GREEN   = "\033[32m";
    const std::string YELLOW  = "\033[33m";
    const std::string CYAN    = "\033[36m";
    const std::string MAGENTA = "\033[35m";
    const std::string BOLD    = "\033[1m";
}

struct BenchResult {
    double duration_ms;
    double mops;
    int64_t computed_value;
};

template <typename Func>
BenchResult run_benchmark(const std::string& name, int64_t iterations, Func func) {
    std::cout << "👉 " << std::left << std::setw(30) << name << "... " << std::flush;

    auto start = std::chrono::high_resolution_clock::now();
    int64_t value = func();
    auto end = std::chrono::high_resolution_clock::now();

    double ms = std::chrono::duration<double, std::milli>(end - start).count();
    double mops = (iterations / 1e6) / (ms / 1000.0);

    std::cout << Color::GREEN << std::fixed << std::setprecision(2) << ms << " ms" << Color::RESET;
    std::cout << " | " << Color::CYAN << std::setprecision(2) << mops << " Mops/s" << Color::RESET << "\n";
    std::cout << "   ↳ Result: " << value << "\n\n";

    return { ms, mops, value };
}

struct ThousandsSeparator : std::numpunct<char> {
    char do_thousands_sep() const override { return ','; }
    std::string do_grouping() const override { return "\3"; }
};

// --- NATIVE C++ WORKLOAD ---
static int64_t run_native_cpp(int64_t limit) {
    int64_t sum = 0;
    int64_t counter = limit;
    while (counter != 0) {
        sum = sum + 1;
        counter = counter - 1;
        __asm__ __volatile__("" : "+r" (counter));
    }
    return sum;
}

// Cùng vòng lặp trên bytecode: cell0 = counter, cell1 = sum
static Program make_loop_program(int64_t limit) {
    using I = Instruction;
    return Program({
        I::push_int(limit), I::store(0),
        I::load(1), I::push_int(1), I::add(), I::store(1),
        I::load(0), I::push_int(1), I::sub(), I::store(0),
        I::load(0), I::jump_if_not_zero(2),
        I::load(1), I::halt(),
    }, 2);
}

int main(int argc, char* argv[]) {
    std::cout.imbue(std::locale(std::cout.getloc(), new ThousandsSeparator));

    int64_t limit = 10'000'000;
    if (argc > 1) {
        try {
            limit = std::stoll(argv[1]);
        } catch (const std::exception&) {
            std::cerr << Color::YELLOW << "⚠️ Invalid argument, using default limit.\n" << Color::RESET;
        }
    }
    if (limit <= 0) limit = 1;

    std::cout << "\n" << Color::BOLD << Color::MAGENTA
              << "🏁 === CINDER VM: INTERPRETER vs JIT vs NATIVE C++ === 🏁"
              << Color::RESET << "\n";
    std::cout << "VM Version: v" << CINDER_VERSION_STR << "\n";
    std::cout << "Iterations: " << limit << "\n";
    std::cout << "------------------------------------------------------------\n\n";

    const Program program = make_loop_program(limit);

    // ROUND 1: NATIVE C++
    auto res_native = run_benchmark("Native C++ (Hardcoded)", limit, [&] {
        return run_native_cpp(limit);
    });

    // ROUND 2: INTERPRETER
    Interpreter interpreter(program);
    bool vm_ok = true;
    auto res_vm = run_benchmark("CinderVM (Interpreter)", limit, [&]() -> int64_t {
        auto result = interpreter.execute();
        if (!result) {
            std::cerr << Color::RED << "❌ " << describe(result.error()) << Color::RESET << "\n";
            vm_ok = false;
            return 0;
        }
        return *result;
    });

    // ROUND 3: JIT (x64)
    std::cout << Color::YELLOW << "⚡ Preparing JIT Engine..." << Color::RESET << "\n";
    jit::JitCompiler compiler(program);
    auto compile_start = std::chrono::high_resolution_clock::now();
    std::optional<jit::FinalizedCode> compiled;
    try {
        compiled.emplace(compiler.compile());
    } catch (const CinderError& e) {
        std::cerr << Color::RED << "❌ JIT Compilation Failed: " << e.what() << Color::RESET << "\n";
        return 1;
    }
    const jit::FinalizedCode& code = *compiled;
    auto compile_end = std::chrono::high_resolution_clock::now();
    std::cout << "   Compiled " << code.bytes().size() << " bytes in "
              << std::chrono::duration<double, std::micro>(compile_end - compile_start).count() << " us\n";

    bool jit_ok = true;
    auto res_jit = run_benchmark("CinderVM (JIT x64)", limit, [&]() -> int64_t {
        auto result = code.invoke();
        if (!result) {
            std::cerr << Color::RED << "❌ " << describe(result.error()) << Color::RESET << "\n";
            jit_ok = false;
            return 0;
        }
        return *result;
    });

    std::cout << "------------------------------------------------------------\n";
    std::cout << "📊 " << Color::BOLD << "SUMMARY REPORT" << Color::RESET << ":\n";

    bool correct = vm_ok && jit_ok &&
                   res_native.computed_value == res_vm.computed_value &&
                   res_native.computed_value == res_jit.computed_value;
    if (correct) {
        std::cout << "✅ Logic Check: " << Color::GREEN << "PASSED" << Color::RESET << " (All results match)\n";
    } else {
        std::cout << "❌ Logic Check: " << Color::RED << "FAILED" << Color::RESET << "\n";
        std::cout << "   Native: " << res_native.computed_value << "\n";
        std::cout << "   VM    : " << res_vm.computed_value << "\n";
        std::cout << "   JIT   : " << res_jit.computed_value << "\n";
    }

    std::cout << std::setprecision(2)
              << "   Interpreter slowdown vs native: " << res_vm.duration_ms / res_native.duration_ms << "x\n"
              << "   JIT slowdown vs native        : " << res_jit.duration_ms / res_native.duration_ms << "x\n"
              << "   JIT speedup vs interpreter    : " << res_vm.duration_ms / res_jit.duration_ms << "x\n";

    return correct ? 0 : 1;
}
