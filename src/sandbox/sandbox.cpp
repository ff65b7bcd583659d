#include <cinder/sandbox/sandbox.h>
#include <cinder/vm/limits.h>
#include "jit/jit_config.h"
#include <format>
#include <print>
#include <stdexcept>

namespace cinder {

Sandbox::Sandbox(Program program) : program_(std::move(program)) {}

void Sandbox::allow_native(uint32_t id) {
    if (is_validated()) {
        throw std::logic_error("Sandbox: whitelist is frozen after validation");
    }
    whitelist_.allow(id);
}

const StackLayout& Sandbox::stack_layout() const {
    if (!layout_) throw std::logic_error("Sandbox: stack layout requested before validation");
    return *layout_;
}

void Sandbox::validate() {
    if (layout_) return;

    check_memory_size();
    for (size_t i = 0; i < program_.size(); ++i) {
        check_instruction(i, program_[i]);
    }
    layout_ = analyze_stack(program_);

    if constexpr (jit::JIT_DEBUG_LOG) {
        std::println(stderr, "[Sandbox] Validated {} instructions (max depth {}, memory {} cells)",
                     program_.size(), layout_->max_depth, program_.memory_size());
    }
}

void Sandbox::check_memory_size() const {
    const size_t size = program_.memory_size();
    if (size == 0 || size > MAX_MEMORY_CELLS) {
        throw ValidationError(ValidationErrorKind::InvalidMemorySize, ValidationError::NO_INDEX,
            std::format("Invalid memory size {}: must be between 1 and {}", size, MAX_MEMORY_CELLS));
    }
}

void Sandbox::check_instruction(size_t index, const Instruction& inst) const {
    using enum OpCode;
    switch (inst.op) {
        case JUMP:
        case JUMP_IF_ZERO:
        case JUMP_IF_NOT_ZERO:
            if (inst.operand < 0 || inst.target() >= program_.size()) {
                throw ValidationError(ValidationErrorKind::OutOfBoundsJump, index,
                    std::format("Invalid jump at instruction {}: target {} exceeds bounds", index, inst.operand));
            }
            break;

        case LOAD:
        case STORE:
            if (inst.operand < 0 || inst.offset() >= program_.memory_size()) {
                throw ValidationError(ValidationErrorKind::OutOfBoundsMemoryAccess, index,
                    std::format("Invalid memory access at instruction {}: offset {} exceeds memory size {}",
                                index, inst.operand, program_.memory_size()));
            }
            break;

        case CALL_NATIVE:
            if (!whitelist_.contains(inst.native_id())) {
                throw ValidationError(ValidationErrorKind::DisallowedNativeCall, index,
                    std::format("Disallowed native call at instruction {}: function 0x{:02X} is not whitelisted",
                                index, inst.native_id()));
            }
            break;

        default:
            break;
    }
}

} // namespace cinder
