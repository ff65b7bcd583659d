#include <cinder/vm/interpreter.h>
#include "vm/handlers/data_ops.h"
#include "vm/handlers/math_ops.h"
#include "vm/handlers/flow_ops.h"
#include "vm/handlers/memory_ops.h"
#include <algorithm>

namespace cinder {

namespace {
    using OpHandler = bool (*)(const Instruction&, InterpreterState&);

    static OpHandler dispatch_table[256];

    struct TableInitializer {
        TableInitializer() {
            for (int i = 0; i < 256; ++i) {
                dispatch_table[i] = handlers::impl_UNIMPL;
            }

            #define reg(NAME) dispatch_table[static_cast<size_t>(OpCode::NAME)] = handlers::impl_##NAME

            // Stack
            reg(PUSH_INT); reg(PUSH_REG); reg(POP);

            // Math & compare
            reg(ADD); reg(SUB); reg(MUL); reg(DIV);
            reg(EQ); reg(LT); reg(GT);

            // Control Flow
            reg(JUMP); reg(JUMP_IF_ZERO); reg(JUMP_IF_NOT_ZERO);
            reg(CALL_NATIVE); reg(RETURN); reg(HALT);

            // Memory
            reg(LOAD); reg(STORE);

            #undef reg
        }
    };

    static TableInitializer init_trigger;

} // namespace anonymous

Interpreter::Interpreter(Program program, const NativeTable& natives)
    : program_(std::move(program)), natives_(natives) {}

void Interpreter::reset() {
    state_.stack.clear();
    state_.stack.reserve(64);
    state_.memory.assign(std::max(program_.memory_size(), MIN_INTERPRETER_MEMORY), 0);
    state_.pc = 0;
    state_.halted = false;
    state_.result = 0;
    state_.fault.reset();
    state_.program = &program_;
    state_.natives = &natives_;
    state_.whitelist = &whitelist_;
}

ExecResult Interpreter::execute() {
    reset();

    const size_t count = program_.size();
    while (state_.pc < count) {
        const Instruction& inst = program_[state_.pc];
        if (!dispatch_table[static_cast<uint8_t>(inst.op)](inst, state_)) break;
    }

    if (state_.fault) [[unlikely]] return meow::unexpected(*state_.fault);

    // Rơi khỏi cuối chương trình: tương đương Halt
    if (!state_.halted) handlers::finish(state_);
    return state_.result;
}

} // namespace cinder
