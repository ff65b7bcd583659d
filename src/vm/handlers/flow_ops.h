#pragma once
#include "vm/handlers/utils.h"

namespace cinder::handlers {

    [[gnu::always_inline]]
    inline bool jump_to(InterpreterState& state, const Instruction& inst) noexcept {
        if (inst.operand < 0 || inst.target() >= state.program->size()) [[unlikely]] {
            return fault(state, ExecError::InvalidJumpTarget);
        }
        state.pc = inst.target();
        return true;
    }

    HOT_HANDLER impl_JUMP(const Instruction& inst, InterpreterState& state) {
        return jump_to(state, inst);
    }

    HOT_HANDLER impl_JUMP_IF_ZERO(const Instruction& inst, InterpreterState& state) {
        int64_t cond;
        if (!pop(state, cond)) [[unlikely]] return fault(state, ExecError::StackUnderflow);
        if (cond == 0) return jump_to(state, inst);
        ++state.pc;
        return true;
    }

    HOT_HANDLER impl_JUMP_IF_NOT_ZERO(const Instruction& inst, InterpreterState& state) {
        int64_t cond;
        if (!pop(state, cond)) [[unlikely]] return fault(state, ExecError::StackUnderflow);
        if (cond != 0) return jump_to(state, inst);
        ++state.pc;
        return true;
    }

    HOT_HANDLER impl_CALL_NATIVE(const Instruction& inst, InterpreterState& state) {
        const uint32_t id = inst.native_id();
        if (!state.whitelist->contains(id)) [[unlikely]] return fault(state, ExecError::DisallowedNativeCall);

        const NativeEntry* entry = state.natives->find(id);
        if (entry == nullptr || entry->fn == nullptr) [[unlikely]] return fault(state, ExecError::UnknownNative);

        int64_t arg;
        if (!pop(state, arg)) [[unlikely]] return fault(state, ExecError::StackUnderflow);
        state.stack.push_back(entry->fn(arg));
        ++state.pc;
        return true;
    }

    HOT_HANDLER impl_RETURN([[maybe_unused]] const Instruction& inst, InterpreterState& state) {
        return finish(state);
    }

    HOT_HANDLER impl_HALT([[maybe_unused]] const Instruction& inst, InterpreterState& state) {
        return finish(state);
    }

} // namespace cinder::handlers
