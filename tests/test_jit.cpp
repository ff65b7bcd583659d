#include "test_utils.h"
#include "jit/x64/code_generator.h"
#include <cinder/jit/jit_compiler.h>
#include <cinder/vm/interpreter.h>
#include <cstdint>
#include <optional>
#include <thread>

using namespace cinder;
using namespace cinder::jit;
using namespace cinder::tests;
using I = Instruction;

// --- Natives dùng riêng cho test ---
static int64_t twice(int64_t v) { return v * 2; }
static int64_t negate(int64_t v) { return -v; }

// Native trả về -1 nếu được gọi với stack lệch 16 byte
static int64_t aligned_echo(int64_t v) {
    const auto frame = reinterpret_cast<uintptr_t>(__builtin_frame_address(0));
    return frame % 16 == 0 ? v : -1;
}

static constexpr uint32_t TWICE_ID   = 0x10;
static constexpr uint32_t NEGATE_ID  = 0x11;
static constexpr uint32_t ALIGNED_ID = 0x12;

static const NativeTable& test_natives() {
    static const NativeTable table = [] {
        NativeTable t;
        t.register_native(TWICE_ID, "twice", twice);
        t.register_native(NEGATE_ID, "negate", negate);
        t.register_native(ALIGNED_ID, "aligned_echo", aligned_echo);
        return t;
    }();
    return table;
}

static ExecResult run_jit(const Program& program, const NativeTable& natives = NativeTable::builtins(),
                          std::initializer_list<uint32_t> allowed = {}) {
    JitCompiler compiler(program, natives);
    for (uint32_t id : allowed) compiler.allow_native(id);
    FinalizedCode code = compiler.compile();
    return code.invoke();
}

static ExecResult run_interp(const Program& program, const NativeTable& natives = NativeTable::builtins(),
                             std::initializer_list<uint32_t> allowed = {}) {
    Interpreter interpreter(program, natives);
    for (uint32_t id : allowed) interpreter.allow_native(id);
    return interpreter.execute();
}

// Interpreter là oracle: cùng giá trị, hoặc cùng loại lỗi (JIT không biết pc)
static bool agrees(const Program& program, const NativeTable& natives = NativeTable::builtins(),
                   std::initializer_list<uint32_t> allowed = {}) {
    const ExecResult expected = run_interp(program, natives, allowed);
    const ExecResult actual = run_jit(program, natives, allowed);
    if (expected.has_value() != actual.has_value()) return false;
    if (expected.has_value()) return *expected == *actual;
    return actual.error().kind == expected.error().kind && actual.error().pc == ExecFault::UNKNOWN_PC;
}

static bool yields(const ExecResult& result, int64_t expected) {
    return result.has_value() && *result == expected;
}

static Program counting_loop() {
    return make_program({
        I::push_int(5), I::store(0),
        I::load(1), I::push_int(1), I::add(), I::store(1),
        I::load(0), I::push_int(1), I::sub(), I::store(0),
        I::load(0), I::jump_if_not_zero(2),
        I::load(1), I::halt(),
    }, 4);
}

static void arithmetic_matches_interpreter() {
    CHECK(yields(run_jit(make_program({I::push_int(3), I::push_int(4), I::add(), I::halt()})), 7));
    CHECK(yields(run_jit(make_program({I::push_int(10), I::push_int(3), I::sub(), I::halt()})), 7));
    CHECK(agrees(make_program({I::push_int(6), I::push_int(-7), I::mul(), I::halt()})));
    CHECK(agrees(make_program({I::push_int(-7), I::push_int(2), I::div(), I::halt()})));
    CHECK(agrees(make_program({I::push_int(7), I::push_int(-2), I::div(), I::halt()})));
}

static void wrapping_matches_interpreter() {
    CHECK(yields(run_jit(make_program({I::push_int(INT64_MAX), I::push_int(1), I::add(), I::halt()})), INT64_MIN));
    CHECK(yields(run_jit(make_program({I::push_int(INT64_MIN), I::push_int(-1), I::div(), I::halt()})), INT64_MIN));
    CHECK(agrees(make_program({I::push_int(INT64_MAX), I::push_int(INT64_MAX), I::mul(), I::halt()})));
    CHECK(agrees(make_program({I::push_int(INT64_MIN), I::push_int(1), I::sub(), I::halt()})));
}

static void comparisons_match_interpreter() {
    CHECK(yields(run_jit(make_program({I::push_int(5), I::push_int(5), I::eq(), I::halt()})), 1));
    CHECK(yields(run_jit(make_program({I::push_int(2), I::push_int(3), I::lt(), I::halt()})), 1));
    CHECK(yields(run_jit(make_program({I::push_int(2), I::push_int(3), I::gt(), I::halt()})), 0));
    CHECK(agrees(make_program({I::push_int(-1), I::push_int(-2), I::gt(), I::halt()})));
    CHECK(agrees(make_program({I::push_int(INT64_MIN), I::push_int(INT64_MAX), I::lt(), I::halt()})));
}

static void termination_values() {
    CHECK(yields(run_jit(make_program({})), 0));
    CHECK(yields(run_jit(make_program({I::halt()})), 0));
    CHECK(yields(run_jit(make_program({I::push_int(1), I::push_int(9)})), 9));
    CHECK(agrees(make_program({I::push_int(1), I::push_int(2), I::ret(), I::push_int(3)})));
}

static void memory_and_branches() {
    CHECK(yields(run_jit(counting_loop()), 5));
    CHECK(agrees(counting_loop()));

    // Ô nhớ bắt đầu bằng 0
    CHECK(yields(run_jit(make_program({I::load(3), I::halt()}, 4)), 0));
    CHECK(agrees(make_program({I::push_int(11), I::store(2), I::push_int(22), I::store(0), I::load(2), I::halt()}, 3)));

    // if (0) 100 else 200
    CHECK(yields(run_jit(make_program({
        I::push_int(0), I::jump_if_zero(4),
        I::push_int(100), I::halt(),
        I::push_int(200), I::halt(),
    })), 200));
}

static void loop_with_backward_jump() {
    // i = 0; loop: if (i - 5 == 0) goto end; i = i + 1; goto loop; end: return i
    const Program program = make_program({
        I::push_int(0), I::store(0),
        I::load(0), I::push_int(5), I::sub(), I::jump_if_zero(11),
        I::load(0), I::push_int(1), I::add(), I::store(0),
        I::jump(2),
        I::load(0), I::halt(),
    }, 1);
    CHECK(yields(run_jit(program), 5));
    CHECK(agrees(program));

    // Nhảy tiến qua một đoạn code rồi nhảy lùi về
    const Program hops = make_program({
        I::jump(3),
        I::push_int(7), I::halt(),
        I::jump(1),
    });
    CHECK(yields(run_jit(hops), 7));
    CHECK(agrees(hops));
}

static void branches_merge_with_different_heights() {
    // Nhánh nhảy tới HALT với stack rỗng, nhánh rơi xuống với một phần tử
    const Program taken = make_program({I::push_int(0), I::jump_if_zero(3), I::push_int(5), I::halt()});
    CHECK(yields(run_jit(taken), 0));
    CHECK(agrees(taken));

    const Program fallthrough = make_program({I::push_int(1), I::jump_if_zero(3), I::push_int(5), I::halt()});
    CHECK(yields(run_jit(fallthrough), 5));
    CHECK(agrees(fallthrough));

    // Giá trị trả về khi rơi khỏi lệnh cuối cũng phụ thuộc nhánh
    CHECK(agrees(make_program({I::push_int(0), I::jump_if_not_zero(3), I::push_int(8), I::push_int(9)})));
    CHECK(agrees(make_program({I::push_int(2), I::jump_if_not_zero(3), I::push_int(8), I::push_int(9)})));
}

static void factorial() {
    // cell0 = n, cell1 = acc
    const Program program = make_program({
        I::push_int(10), I::store(0),
        I::push_int(1), I::store(1),
        I::load(1), I::load(0), I::mul(), I::store(1),
        I::load(0), I::push_int(1), I::sub(), I::store(0),
        I::load(0), I::push_int(1), I::gt(), I::jump_if_not_zero(4),
        I::load(1), I::ret(),
    }, 2);
    CHECK(yields(run_jit(program), 3628800));
    CHECK(agrees(program));
}

static void runtime_faults_match_interpreter() {
    const Program div_zero = make_program({I::push_int(42), I::push_int(0), I::div(), I::halt()});
    const ExecResult result = run_jit(div_zero);
    CHECK(!result.has_value());
    if (!result.has_value()) {
        CHECK(result.error() == (ExecFault{ExecError::DivisionByZero, ExecFault::UNKNOWN_PC}));
    }
    CHECK(agrees(div_zero));

    // Phép chia cho 0 bị nhảy qua thì không gây lỗi
    const Program skipped = make_program({
        I::push_int(0), I::jump_if_zero(6),
        I::push_int(8), I::push_int(0), I::div(), I::pop(),
        I::push_int(3), I::halt(),
    });
    CHECK(yields(run_jit(skipped), 3));
    CHECK(agrees(skipped));

    CHECK(agrees(make_program({I::push_reg(1), I::halt()})));
    CHECK(agrees(make_program({I::push_int(4), I::push_reg(0)})));
}

static void native_calls() {
    const NativeTable& natives = test_natives();

    // Chiều cao chẵn và lẻ tại điểm gọi
    CHECK(yields(run_jit(make_program({I::push_int(21), I::call_native(TWICE_ID), I::halt()}), natives, {TWICE_ID}), 42));
    CHECK(yields(run_jit(make_program({I::push_int(5), I::push_int(1), I::call_native(TWICE_ID), I::add(), I::halt()}),
                         natives, {TWICE_ID}), 7));
    CHECK(agrees(make_program({I::push_int(3), I::call_native(NEGATE_ID), I::call_native(TWICE_ID), I::halt()}),
                 natives, {TWICE_ID, NEGATE_ID}));

    CHECK(yields(run_jit(make_program({I::push_int(7), I::call_native(ALIGNED_ID), I::halt()}), natives, {ALIGNED_ID}), 7));
    CHECK(yields(run_jit(make_program({I::push_int(1), I::push_int(7), I::call_native(ALIGNED_ID), I::halt()}),
                         natives, {ALIGNED_ID}), 7));
    CHECK(yields(run_jit(make_program({I::push_int(1), I::push_int(2), I::push_int(7), I::call_native(ALIGNED_ID), I::halt()}),
                         natives, {ALIGNED_ID}), 7));
}

static void native_call_after_uneven_merge() {
    // Tại lệnh 3 stack cao 0 hoặc 1 tùy nhánh, native phải được căn RSP lúc chạy
    for (int64_t condition : {int64_t{0}, int64_t{1}}) {
        const Program program = make_program({
            I::push_int(condition), I::jump_if_zero(3),
            I::push_int(5),
            I::push_int(7), I::call_native(ALIGNED_ID), I::halt(),
        });
        CHECK(yields(run_jit(program, test_natives(), {ALIGNED_ID}), 7));
        CHECK(agrees(program, test_natives(), {ALIGNED_ID}));
    }
}

static void native_in_loop() {
    // Gọi native nhiều lần từ cùng một slot
    const Program program = make_program({
        I::push_int(3), I::store(0),
        I::push_int(1), I::store(1),
        I::load(1), I::call_native(TWICE_ID), I::store(1),
        I::load(0), I::push_int(1), I::sub(), I::store(0),
        I::load(0), I::jump_if_not_zero(4),
        I::load(1), I::halt(),
    }, 2);
    CHECK(yields(run_jit(program, test_natives(), {TWICE_ID}), 8));
}

static void validation_precedes_compilation() {
    auto expect_kind = [](ValidationErrorKind kind) {
        return [kind](const ValidationError& e) { CHECK(e.kind() == kind); };
    };

    CHECK_THROWS(ValidationError, run_jit(make_program({I::jump(9)})),
                 expect_kind(ValidationErrorKind::OutOfBoundsJump));
    CHECK_THROWS(ValidationError, run_jit(make_program({I::push_int(1), I::call_native(TWICE_ID)}), test_natives()),
                 expect_kind(ValidationErrorKind::DisallowedNativeCall));
    CHECK_THROWS(ValidationError, run_jit(make_program({I::add()})),
                 expect_kind(ValidationErrorKind::StackUnderflow));

    // Chưa compile được thì vẫn còn mở whitelist
    JitCompiler compiler(make_program({I::push_int(2), I::call_native(TWICE_ID), I::halt()}), test_natives());
    CHECK_THROWS(ValidationError, (void)compiler.compile(), ignore_error);
    CHECK(!compiler.sandbox().is_validated());
    compiler.sandbox().allow_native(TWICE_ID);
    CHECK(compiler.sandbox().is_native_allowed(TWICE_ID));
    CHECK(yields(compiler.compile().invoke(), 4));
    CHECK(compiler.sandbox().is_validated());
}

static void whitelisted_native_without_entry() {
    JitCompiler compiler(make_program({I::push_int(1), I::call_native(0x20), I::halt()}), test_natives());
    compiler.allow_native(0x20);
    CHECK_THROWS(EmissionError, (void)compiler.compile(), [](const EmissionError& e) {
        CHECK(e.kind() == EmissionErrorKind::UnresolvedPatch);
    });
}

static void emission_rechecks_whitelist() {
    // Layout của một chương trình đã được duyệt với 0x07, nhưng policy khi sinh mã thì không có
    Sandbox analysed(make_program({I::push_int(1), I::call_native(0x07), I::halt()}));
    analysed.allow_native(0x07);
    analysed.validate();

    Sandbox policy(make_program({I::halt()}));
    policy.validate();
    CHECK(!policy.is_native_allowed(0x07));

    ExecutableMemory memory = ExecutableMemory::allocate(256);
    x64::CodeGenerator codegen(memory, analysed.program(), analysed.stack_layout(), policy, test_natives());
    CHECK_THROWS(EmissionError, codegen.generate(), [](const EmissionError& e) {
        CHECK(e.kind() == EmissionErrorKind::DisallowedNativeAtEmission);
    });
}

static void code_size_estimate_is_an_upper_bound() {
    const Program programs[] = {
        make_program({}),
        counting_loop(),
        make_program({I::push_int(1), I::push_int(2), I::div(), I::push_int(3), I::div(), I::halt()}),
        make_program({I::push_int(1), I::call_native(TWICE_ID), I::push_int(1), I::call_native(NEGATE_ID), I::halt()}),
    };
    for (const Program& program : programs) {
        JitCompiler compiler(program, test_natives());
        compiler.allow_native(TWICE_ID);
        compiler.allow_native(NEGATE_ID);
        FinalizedCode code = compiler.compile();
        CHECK(code.bytes().size() > 0);
        CHECK(code.bytes().size() <= compiler.estimate_code_size());
        CHECK_EQ(code.size(), compiler.estimate_code_size());
    }
}

static void raw_entry_point() {
    JitCompiler compiler(make_program({I::push_int(40), I::push_int(2), I::add(), I::halt()}));
    FinalizedCode code = compiler.compile();
    FinalizedCode::EntryFn fn = code.as_function();
    CHECK_EQ(fn(), int64_t{42});
    CHECK_EQ(fn(), int64_t{42});
}

static void invoke_from_another_thread() {
    JitCompiler compiler(counting_loop());
    FinalizedCode code = compiler.compile();

    std::optional<ExecResult> from_thread;
    std::thread worker([&] { from_thread.emplace(code.invoke()); });
    worker.join();

    CHECK(from_thread.has_value());
    if (from_thread) CHECK(yields(*from_thread, 5));
    CHECK(yields(code.invoke(), 5));
}

int main() {
    static constexpr TestCase cases[] = {
        {"arithmetic matches interpreter", arithmetic_matches_interpreter},
        {"wrapping matches interpreter", wrapping_matches_interpreter},
        {"comparisons match interpreter", comparisons_match_interpreter},
        {"termination values", termination_values},
        {"memory and branches", memory_and_branches},
        {"loop with backward jump", loop_with_backward_jump},
        {"branches merge with different heights", branches_merge_with_different_heights},
        {"factorial", factorial},
        {"runtime faults match interpreter", runtime_faults_match_interpreter},
        {"native calls keep stack aligned", native_calls},
        {"native call after uneven merge", native_call_after_uneven_merge},
        {"native call inside a loop", native_in_loop},
        {"validation precedes compilation", validation_precedes_compilation},
        {"whitelisted native without table entry", whitelisted_native_without_entry},
        {"emission re-checks the whitelist", emission_rechecks_whitelist},
        {"code size estimate is an upper bound", code_size_estimate_is_an_upper_bound},
        {"raw entry point", raw_entry_point},
        {"invoke from another thread", invoke_from_another_thread},
    };
    return run_tests("jit", cases);
}
