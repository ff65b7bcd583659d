/**
 * @file interpreter.h
 * @brief Reference semantics of CinderVM: a checked, single-pass stack interpreter
 */
#pragma once
#include <cinder/bytecode/program.h>
#include <cinder/errors.h>
#include <cinder/vm/native_table.h>
#include <meow_expected.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace cinder {

using ExecResult = meow::expected<int64_t, ExecFault>;

/// Trạng thái máy, được các handler trong src/vm/handlers thao tác trực tiếp
struct InterpreterState {
    std::vector<int64_t> stack;
    std::vector<int64_t> memory;
    size_t pc = 0;
    bool halted = false;
    int64_t result = 0;
    std::optional<ExecFault> fault;

    const Program* program = nullptr;
    const NativeTable* natives = nullptr;
    const NativeWhitelist* whitelist = nullptr;
};

class Interpreter {
public:
    explicit Interpreter(Program program, const NativeTable& natives = NativeTable::builtins());

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void allow_native(uint32_t id) { whitelist_.allow(id); }
    [[nodiscard]] bool is_native_allowed(uint32_t id) const noexcept { return whitelist_.contains(id); }

    /**
     * @brief Chạy chương trình từ pc = 0 cho đến Return/Halt, hết lệnh, hoặc lỗi.
     * @return Giá trị đỉnh stack (0 nếu stack rỗng) hoặc ExecFault.
     * @note Mỗi lần gọi bắt đầu với stack và memory mới.
     */
    [[nodiscard]] ExecResult execute();

    [[nodiscard]] const InterpreterState& state() const noexcept { return state_; }
    [[nodiscard]] const Program& program() const noexcept { return program_; }

private:
    Program program_;
    const NativeTable& natives_;
    NativeWhitelist whitelist_;
    InterpreterState state_;

    void reset();
};

} // namespace cinder
