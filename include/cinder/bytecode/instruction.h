/**
 * @file instruction.h
 * @brief A single decoded CinderVM instruction
 */
#pragma once
#include <cinder/bytecode/op_codes.h>
#include <cstddef>
#include <cstdint>

namespace cinder {

/**
 * @brief Tagged instruction: `op` là tag, `operand` là payload.
 * @details Ý nghĩa của operand phụ thuộc OperandKind của op
 * (immediate, register, jump target, memory offset hoặc native id).
 * Opcode không có operand luôn mang operand = 0.
 */
struct Instruction {
    OpCode op = OpCode::HALT;
    int64_t operand = 0;

    // --- Constructors ---
    static constexpr Instruction push_int(int64_t value) noexcept { return {OpCode::PUSH_INT, value}; }
    static constexpr Instruction push_reg(uint8_t reg) noexcept { return {OpCode::PUSH_REG, reg}; }
    static constexpr Instruction pop() noexcept { return {OpCode::POP, 0}; }
    static constexpr Instruction add() noexcept { return {OpCode::ADD, 0}; }
    static constexpr Instruction sub() noexcept { return {OpCode::SUB, 0}; }
    static constexpr Instruction mul() noexcept { return {OpCode::MUL, 0}; }
    static constexpr Instruction div() noexcept { return {OpCode::DIV, 0}; }
    static constexpr Instruction eq() noexcept { return {OpCode::EQ, 0}; }
    static constexpr Instruction lt() noexcept { return {OpCode::LT, 0}; }
    static constexpr Instruction gt() noexcept { return {OpCode::GT, 0}; }
    static constexpr Instruction jump(size_t target) noexcept {
        return {OpCode::JUMP, static_cast<int64_t>(target)};
    }
    static constexpr Instruction jump_if_zero(size_t target) noexcept {
        return {OpCode::JUMP_IF_ZERO, static_cast<int64_t>(target)};
    }
    static constexpr Instruction jump_if_not_zero(size_t target) noexcept {
        return {OpCode::JUMP_IF_NOT_ZERO, static_cast<int64_t>(target)};
    }
    static constexpr Instruction load(size_t offset) noexcept {
        return {OpCode::LOAD, static_cast<int64_t>(offset)};
    }
    static constexpr Instruction store(size_t offset) noexcept {
        return {OpCode::STORE, static_cast<int64_t>(offset)};
    }
    static constexpr Instruction call_native(uint32_t id) noexcept { return {OpCode::CALL_NATIVE, id}; }
    static constexpr Instruction ret() noexcept { return {OpCode::RETURN, 0}; }
    static constexpr Instruction halt() noexcept { return {OpCode::HALT, 0}; }

    // --- Payload accessors ---
    [[nodiscard]] constexpr int64_t imm() const noexcept { return operand; }
    [[nodiscard]] constexpr uint8_t reg() const noexcept { return static_cast<uint8_t>(operand); }
    [[nodiscard]] constexpr size_t target() const noexcept { return static_cast<size_t>(operand); }
    [[nodiscard]] constexpr size_t offset() const noexcept { return static_cast<size_t>(operand); }
    [[nodiscard]] constexpr uint32_t native_id() const noexcept { return static_cast<uint32_t>(operand); }

    constexpr bool operator==(const Instruction&) const = default;
};

} // namespace cinder
