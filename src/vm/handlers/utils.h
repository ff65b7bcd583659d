#pragma once

#include <cinder/vm/interpreter.h>
#include <cinder/vm/limits.h>
#include <cinder/bytecode/op_codes.h>

// Handler trả về true nếu tiếp tục vòng lặp, false khi dừng (halt hoặc fault)
#define HOT_HANDLER [[gnu::always_inline, gnu::hot]] static bool

namespace cinder {
namespace handlers {

[[gnu::always_inline]]
inline bool fault(InterpreterState& state, ExecError kind) noexcept {
    state.fault = ExecFault{kind, state.pc};
    return false;
}

[[gnu::always_inline]]
inline bool pop(InterpreterState& state, int64_t& out) noexcept {
    if (state.stack.empty()) [[unlikely]] return false;
    out = state.stack.back();
    state.stack.pop_back();
    return true;
}

// Cùng giới hạn MAX_STACK_DEPTH (vm/limits.h) mà phân tích stack của Sandbox dùng cho JIT
[[gnu::always_inline]]
inline bool push(InterpreterState& state, int64_t value) {
    if (state.stack.size() >= MAX_STACK_DEPTH) [[unlikely]] return false;
    state.stack.push_back(value);
    return true;
}

// Kết thúc chương trình với giá trị đỉnh stack (0 nếu rỗng)
[[gnu::always_inline]]
inline bool finish(InterpreterState& state) noexcept {
    state.result = state.stack.empty() ? int64_t{0} : state.stack.back();
    state.halted = true;
    return false;
}

// Tag không phải opcode hợp lệ: coi như pc rơi vào chỗ không phải lệnh
HOT_HANDLER impl_UNIMPL([[maybe_unused]] const Instruction& inst, InterpreterState& state) {
    return fault(state, ExecError::InvalidJumpTarget);
}

} // namespace handlers
} // namespace cinder
