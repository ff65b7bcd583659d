#pragma once
#include "vm/handlers/utils.h"

namespace cinder::handlers {

HOT_HANDLER impl_PUSH_INT(const Instruction& inst, InterpreterState& state) {
    if (!push(state, inst.imm())) [[unlikely]] return fault(state, ExecError::StackOverflow);
    ++state.pc;
    return true;
}

// Register operand chưa có nguồn giá trị: luôn fault
HOT_HANDLER impl_PUSH_REG([[maybe_unused]] const Instruction& inst, InterpreterState& state) {
    return fault(state, ExecError::StackUnderflow);
}

HOT_HANDLER impl_POP([[maybe_unused]] const Instruction& inst, InterpreterState& state) {
    int64_t discarded;
    if (!pop(state, discarded)) [[unlikely]] return fault(state, ExecError::StackUnderflow);
    ++state.pc;
    return true;
}

} // namespace cinder::handlers
