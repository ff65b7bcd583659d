/**
 * @file op_codes.h
 * @brief Opcode set of the CinderVM stack machine
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <meow_enum.h>

namespace cinder {

enum class OpCode : uint8_t {
    PUSH_INT         = 0x01,
    PUSH_REG         = 0x02,
    POP              = 0x03,

    ADD              = 0x10,
    SUB              = 0x11,
    MUL              = 0x12,
    DIV              = 0x13,

    EQ               = 0x20,
    LT               = 0x21,
    GT               = 0x22,

    JUMP             = 0x30,
    JUMP_IF_ZERO     = 0x31,
    JUMP_IF_NOT_ZERO = 0x32,

    LOAD             = 0x40,
    STORE            = 0x41,

    CALL_NATIVE      = 0x50,
    RETURN           = 0x51,

    HALT             = 0xFF
};

// Loại toán hạng đi kèm mỗi opcode
enum class OperandKind : uint8_t {
    NONE,
    IMM64,      // PUSH_INT
    REG8,       // PUSH_REG
    TARGET,     // JUMP*: chỉ số lệnh đích
    OFFSET,     // LOAD / STORE: ô nhớ
    NATIVE_ID   // CALL_NATIVE
};

struct OpInfo {
    uint8_t pops;          // Số giá trị lấy ra khỏi operand stack
    uint8_t pushes;        // Số giá trị đẩy vào
    OperandKind operand;
};

// Single source of truth cho hiệu ứng stack (dùng bởi Sandbox và Disassembler)
constexpr OpInfo get_op_info(OpCode op) {
    using enum OpCode;
    switch (op) {
        case PUSH_INT:         return {0, 1, OperandKind::IMM64};
        case PUSH_REG:         return {0, 1, OperandKind::REG8};
        case POP:              return {1, 0, OperandKind::NONE};

        case ADD: case SUB: case MUL: case DIV:
        case EQ: case LT: case GT:
            return {2, 1, OperandKind::NONE};

        case JUMP:             return {0, 0, OperandKind::TARGET};
        case JUMP_IF_ZERO:
        case JUMP_IF_NOT_ZERO: return {1, 0, OperandKind::TARGET};

        case LOAD:             return {0, 1, OperandKind::OFFSET};
        case STORE:            return {1, 0, OperandKind::OFFSET};

        case CALL_NATIVE:      return {1, 1, OperandKind::NATIVE_ID};
        case RETURN: case HALT:
            return {0, 0, OperandKind::NONE};
    }
    return {0, 0, OperandKind::NONE};
}

/// Lệnh không có successor fall-through
constexpr bool is_terminator(OpCode op) noexcept {
    return op == OpCode::JUMP || op == OpCode::RETURN || op == OpCode::HALT || op == OpCode::PUSH_REG;
}

constexpr bool is_branch(OpCode op) noexcept {
    return op == OpCode::JUMP || op == OpCode::JUMP_IF_ZERO || op == OpCode::JUMP_IF_NOT_ZERO;
}

[[nodiscard]] constexpr uint8_t to_byte(OpCode op) noexcept {
    return static_cast<uint8_t>(op);
}

[[nodiscard]] std::optional<OpCode> from_byte(uint8_t byte) noexcept;
[[nodiscard]] std::optional<OpCode> from_mnemonic(std::string_view text) noexcept;
[[nodiscard]] std::string_view mnemonic(OpCode op) noexcept;

} // namespace cinder

// OpCode là uint8_t (0-255), mở rộng range quét của meow::enum_name
namespace meow {
template <>
struct enum_traits<cinder::OpCode> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 255;
};
} // namespace meow
