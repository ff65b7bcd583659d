/**
 * @file common.h
 * @brief Shared definitions for the x64 backend (Registers, Conditions, ABI roles)
 */

#pragma once

#include <cstdint>

namespace cinder::jit::x64 {

    // --- x64 Hardware Registers ---
    enum Reg : uint8_t {
        RAX = 0, RCX = 1, RDX = 2, RBX = 3,
        RSP = 4, RBP = 5, RSI = 6, RDI = 7,
        R8  = 8, R9  = 9, R10 = 10, R11 = 11,
        R12 = 12, R13 = 13, R14 = 14, R15 = 15,
        INVALID_REG = 0xFF
    };

    // --- CPU Condition Codes (EFLAGS) ---
    enum Condition : uint8_t {
        O  = 0,  NO = 1,  // Overflow
        B  = 2,  AE = 3,  // Below / Above or Equal (Unsigned)
        E  = 4,  NE = 5,  // Equal / Not Equal
        BE = 6,  A  = 7,  // Below or Equal / Above (Unsigned)
        S  = 8,  NS = 9,  // Sign
        P  = 10, NP = 11, // Parity
        L  = 12, GE = 13, // Less / Greater or Equal (Signed)
        LE = 14, G  = 15  // Less or Equal / Greater (Signed)
    };

    // --- CinderVM Calling Convention (System V AMD64) ---

    // Operand trái / kết quả, và giá trị trả về
    static constexpr Reg REG_LHS    = RAX;
    // Operand phải (byte thấp CL không cần, chỉ dùng 64-bit)
    static constexpr Reg REG_RHS    = RCX;
    // Kênh báo lỗi: RDX = 0 nghĩa là thành công
    static constexpr Reg REG_FAULT  = RDX;
    // Tham số đầu tiên cho native function
    static constexpr Reg REG_ARG0   = RDI;
    // Base của vùng memory cells trong stack frame
    static constexpr Reg REG_FRAME  = RBP;

} // namespace cinder::jit::x64
