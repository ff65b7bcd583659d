#pragma once
#include "vm/handlers/utils.h"

namespace cinder::handlers {

HOT_HANDLER impl_LOAD(const Instruction& inst, InterpreterState& state) {
    const size_t offset = inst.offset();
    if (inst.operand < 0 || offset >= state.memory.size()) [[unlikely]] {
        return fault(state, ExecError::InvalidMemoryAccess);
    }
    if (!push(state, state.memory[offset])) [[unlikely]] return fault(state, ExecError::StackOverflow);
    ++state.pc;
    return true;
}

HOT_HANDLER impl_STORE(const Instruction& inst, InterpreterState& state) {
    const size_t offset = inst.offset();
    if (inst.operand < 0 || offset >= state.memory.size()) [[unlikely]] {
        return fault(state, ExecError::InvalidMemoryAccess);
    }
    int64_t value;
    if (!pop(state, value)) [[unlikely]] return fault(state, ExecError::StackUnderflow);
    state.memory[offset] = value;
    ++state.pc;
    return true;
}

} // namespace cinder::handlers
