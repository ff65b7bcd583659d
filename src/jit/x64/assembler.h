/**
 * @file assembler.h
 * @brief Low-level x64 machine code emitter writing straight into executable memory
 */

#pragma once

#include "jit/x64/common.h"
#include <cinder/jit/executable_memory.h>
#include <cstddef>
#include <cstdint>

namespace cinder::jit::x64 {

    class Assembler {
    public:
        explicit Assembler(ExecutableMemory& memory);

        // --- Buffer Management ---
        size_t cursor() const { return size_; }
        void patch_u8(size_t offset, uint8_t value);
        void patch_u32(size_t offset, uint32_t value);
        void patch_u64(size_t offset, uint64_t value);
        void align(size_t boundary, uint8_t filler = 0xCC);
        void emit_u64(uint64_t v);

        // --- Data Movement ---
        void mov(Reg dst, Reg src);
        void mov(Reg dst, int64_t imm64);        // MOV r64, imm64
        void mov(Reg dst, Reg base, int32_t disp); // Load: MOV dst, [base + disp]
        void mov(Reg base, int32_t disp, Reg src); // Store: MOV [base + disp], src
        void lea(Reg dst, Reg base, int32_t disp); // LEA dst, [base + disp]

        // --- Arithmetic (ALU) ---
        void add(Reg dst, Reg src);
        void sub(Reg dst, Reg src);
        void add(Reg dst, int32_t imm);   // ADD r64, imm32
        void sub(Reg dst, int32_t imm);   // SUB r64, imm32
        void imul(Reg dst, Reg src);
        void xor_(Reg dst, Reg src);
        void and_(Reg dst, int8_t imm);   // AND r64, imm8 (sign-extended)
        void neg(Reg dst);
        void cqo();                       // Sign-extend RAX -> RDX:RAX
        void idiv(Reg divisor);           // RDX:RAX / divisor

        // --- Control Flow & Comparison ---
        void cmp(Reg r1, Reg r2);
        void cmp(Reg r1, int8_t imm);     // CMP r64, imm8 (sign-extended)
        void test(Reg r1, Reg r2);

        void jmp(int32_t rel_offset);      // JMP rel32
        void jmp_short(int8_t rel_offset); // JMP rel8

        void jcc(Condition cond, int32_t rel_offset);
        void jcc_short(Condition cond, int8_t rel_offset);

        void call_rip(int32_t disp);       // CALL [RIP + disp32]
        void ret();
        void int3();

        // --- Stack ---
        void push(Reg r);
        void pop(Reg r);

        // --- Helper Instructions ---
        void setcc(Condition cond, Reg dst); // SETcc r8
        void movzx_b(Reg dst, Reg src);      // MOVZX r64, r8
        void rep_stosq();                    // Fill [RDI] with RAX, RCX lần

    private:
        void emit(uint8_t b);
        void emit_u32(uint32_t v);

        // Encoding Helpers
        void emit_rex(bool w, bool r, bool x, bool b);
        void emit_modrm(int mode, int reg, int rm);
        void emit_mem_operand(Reg reg, Reg base, int32_t disp);
        void emit_alu(uint8_t opcode, Reg dst, Reg src);

        ExecutableMemory& memory_;
        size_t size_;
    };

} // namespace cinder::jit::x64
