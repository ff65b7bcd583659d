#pragma once
#include "vm/handlers/utils.h"
#include <limits>

namespace cinder::handlers {

// Số học two's-complement: tính trên uint64_t để overflow wrap thay vì UB
[[gnu::always_inline]] inline int64_t wrap_add(int64_t a, int64_t b) noexcept {
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}
[[gnu::always_inline]] inline int64_t wrap_sub(int64_t a, int64_t b) noexcept {
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}
[[gnu::always_inline]] inline int64_t wrap_mul(int64_t a, int64_t b) noexcept {
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

// --- MACROS ---
// Right pop trước, left pop sau; push(left OP right)
#define BINARY_OP_IMPL(NAME, EXPR) \
    HOT_HANDLER impl_##NAME([[maybe_unused]] const Instruction& inst, InterpreterState& state) { \
        int64_t right, left; \
        if (!pop(state, right) || !pop(state, left)) [[unlikely]] return fault(state, ExecError::StackUnderflow); \
        state.stack.push_back(EXPR); \
        ++state.pc; \
        return true; \
    }

BINARY_OP_IMPL(ADD, wrap_add(left, right))
BINARY_OP_IMPL(SUB, wrap_sub(left, right))
BINARY_OP_IMPL(MUL, wrap_mul(left, right))

BINARY_OP_IMPL(EQ, int64_t{left == right})
BINARY_OP_IMPL(LT, int64_t{left < right})
BINARY_OP_IMPL(GT, int64_t{left > right})

HOT_HANDLER impl_DIV([[maybe_unused]] const Instruction& inst, InterpreterState& state) {
    int64_t right, left;
    if (!pop(state, right) || !pop(state, left)) [[unlikely]] return fault(state, ExecError::StackUnderflow);
    if (right == 0) [[unlikely]] return fault(state, ExecError::DivisionByZero);

    // INT64_MIN / -1 wrap về INT64_MIN, giống phép neg của phần cứng
    if (right == -1) state.stack.push_back(wrap_sub(0, left));
    else state.stack.push_back(left / right);
    ++state.pc;
    return true;
}

#undef BINARY_OP_IMPL

} // namespace cinder::handlers
